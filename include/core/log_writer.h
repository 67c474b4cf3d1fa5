#ifndef LOG_WRITER_H
#define LOG_WRITER_H

#include <string>

class ILogWriter {
public:
  virtual ~ILogWriter() = default;

  virtual bool write(const std::string &formattedMessage) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

class ConsoleLogWriter : public ILogWriter {
public:
  bool write(const std::string &formattedMessage) override;
  void flush() override;
  void close() override {}
  bool isOpen() const override { return true; }
};

#endif
