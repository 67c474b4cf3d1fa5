#include "sandbox/runner_script.h"

namespace {

const char *const HARNESS = R"PY(
import asyncio
import json
import os
import threading

_to_host = os.fdopen(3, "w", encoding="utf-8", buffering=1)
_from_host = os.fdopen(4, "r", encoding="utf-8")
_channel_lock = threading.Lock()
_call_counter = [0]


def _send(message):
    _to_host.write(json.dumps(message) + "\n")
    _to_host.flush()


def _call(capability, args):
    with _channel_lock:
        _call_counter[0] += 1
        call_id = _call_counter[0]
        _send({"type": "call", "id": call_id, "capability": capability, "args": args})
        line = _from_host.readline()
    if not line:
        raise RuntimeError("capability channel closed")
    reply = json.loads(line)
    if reply.get("id") != call_id:
        raise RuntimeError("capability channel out of sync")
    if not reply.get("ok"):
        raise RuntimeError(reply.get("error") or "capability call failed")
    return reply.get("value")


class _ParadigmClient:
    async def _invoke(self, capability, args):
        loop = asyncio.get_running_loop()
        return await loop.run_in_executor(None, _call, capability, args)

    async def document_search(self, query, workspace_ids=None, file_ids=None,
                              company_scope=True, private_scope=True,
                              tool="DocumentSearch", private=False, **kwargs):
        return await self._invoke("document_search", {
            "query": query, "workspace_ids": workspace_ids,
            "file_ids": file_ids, "company_scope": company_scope,
            "private_scope": private_scope, "tool": tool, "private": private})

    async def analyze_documents_with_polling(self, query, document_ids,
                                             model=None, private=False,
                                             **kwargs):
        return await self._invoke("analyze_documents_with_polling", {
            "query": query, "document_ids": document_ids,
            "model": model, "private": private})

    async def chat_completion(self, prompt, model=None, **kwargs):
        return await self._invoke("chat_completion",
                                  {"prompt": prompt, "model": model})

    async def analyze_image(self, query, document_ids, model=None,
                            private=False, **kwargs):
        return await self._invoke("analyze_image", {
            "query": query, "document_ids": document_ids,
            "model": model, "private": private})


def _check_syntax(code):
    try:
        compile(code, "<workflow>", "exec", dont_inherit=True)
    except SyntaxError as exc:
        return f"line {exc.lineno or 0}: {exc.msg}"
    except ValueError as exc:
        return f"line 0: {exc}"
    return ""


def _main():
    start = json.loads(_from_host.readline())
    if start.get("compile_only"):
        _send({"type": "result", "ok": True,
               "value": _check_syntax(start["code"])})
        return
    namespace = {
        "__name__": "__workflow__",
        "__builtins__": __builtins__,
        "paradigm_client": _ParadigmClient(),
        "attached_file_ids": start.get("attached_file_ids"),
    }
    try:
        exec(compile(start["code"], "<workflow>", "exec"), namespace)
        entry = namespace.get("execute_workflow")
        if entry is None:
            raise NameError("execute_workflow is not defined")
        result = asyncio.run(entry(start.get("user_input", "")))
        if result is None:
            result = ""
        elif not isinstance(result, str):
            result = str(result)
        _send({"type": "result", "ok": True, "value": result})
    except BaseException as exc:
        _send({"type": "result", "ok": False,
               "error": f"{type(exc).__name__}: {exc}"})


_main()
)PY";

} // namespace

const std::string &sandboxHarnessSource() {
  static const std::string source = HARNESS;
  return source;
}
