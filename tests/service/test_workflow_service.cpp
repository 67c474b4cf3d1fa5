#include "../mocks/mock_services.h"
#include "service/request_dispatcher.h"
#include "service/workflow_service.h"
#include <cassert>
#include <iostream>
#include <memory>

namespace {
const std::string GOOD_RESPONSE =
    "```python\nimport asyncio\nimport aiohttp\n\n"
    "async def execute_workflow(user_input: str) -> str:\n"
    "    return user_input\n```";

const std::string IMPROVED_RESPONSE =
    "import asyncio\nimport aiohttp\n\n"
    "async def execute_workflow(user_input: str) -> str:\n"
    "    return 'improved: ' + user_input\n";

// Runs with python3 on PATH but without aiohttp installed.
const std::string RUNNABLE_CODE =
    "import asyncio\n\nasync def execute_workflow(user_input):\n"
    "    return 'ran ' + user_input\n";

struct Fixture {
  WorkflowStore store;
  std::shared_ptr<MockGenerationService> generation =
      std::make_shared<MockGenerationService>();
  std::shared_ptr<CapabilityBroker> broker =
      std::make_shared<CapabilityBroker>(
          std::make_shared<MockCapabilityProvider>());
  WorkflowGenerator generator{store, generation};
  WorkflowExecutor executor{store, settings(), broker};
  WorkerPool pool{2};
  WorkflowService service{store, generator, executor, pool};

  static ExecutionSettings settings() {
    ExecutionSettings execution;
    execution.timeout_seconds = 10;
    execution.network_isolation = IsolationMode::OFF;
    execution.filesystem_isolation = IsolationMode::OFF;
    return execution;
  }

  std::string storeRunnable() {
    Workflow workflow = Workflow::create("runnable");
    store.storeWorkflow(workflow);
    store.updateWorkflow(workflow.id, [](Workflow &w) {
      w.updateStatus(WorkflowStatus::GENERATING);
      w.markReady(RUNNABLE_CODE);
    });
    return workflow.id;
  }
};

bool contains(const std::string &text, const std::string &needle) {
  return text.find(needle) != std::string::npos;
}
} // namespace

void testCreateAndFetch() {
  std::cout << "Testing WorkflowService - create and fetch...\n";

  Fixture fx;
  fx.generation->enqueue(GOOD_RESPONSE);
  Workflow created = fx.service.createWorkflow("Echo the input");
  assert(created.status == WorkflowStatus::READY);
  assert(fx.service.getWorkflow(created.id).generated_code ==
         created.generated_code);

  bool threw = false;
  try {
    fx.service.getWorkflow("missing");
  } catch (const WorkflowNotFoundError &) {
    threw = true;
  }
  assert(threw);

  fx.generation->enqueue(GOOD_RESPONSE);
  Workflow withFiles = fx.service.createWorkflowWithFiles(
      "Summarise my files", {"f1", "f2"}, std::nullopt, {{"tone", "short"}});
  assert(withFiles.context["uploaded_file_ids"] == json::array({"f1", "f2"}));
  assert(withFiles.context["use_uploaded_files"] == true);
  assert(withFiles.context["tone"] == "short");
  assert(contains(fx.generation->requests().back().user, "attached_file_ids"));

  fx.generation->enqueue(GOOD_RESPONSE);
  Workflow async = fx.service.createWorkflowAsync("Async echo").get();
  assert(async.status == WorkflowStatus::READY);

  std::cout << "✓ WorkflowService create and fetch test passed\n";
}

void testExecutionScoping() {
  std::cout << "Testing WorkflowService - execution scoping...\n";

  Fixture fx;
  std::string first = fx.storeRunnable();
  std::string second = fx.storeRunnable();

  WorkflowExecution execution =
      fx.service.executeWorkflowAsync(first, "input").get();
  assert(execution.status == ExecutionStatus::COMPLETED);
  assert(execution.result == std::optional<std::string>("ran input"));

  assert(fx.service.getExecution(first, execution.id).id == execution.id);

  bool threw = false;
  try {
    fx.service.getExecution(second, execution.id);
  } catch (const ExecutionNotFoundError &) {
    assert(false && "a foreign execution is a caller error, not not-found");
  } catch (const InvalidRequestError &) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    fx.service.getExecution(first, "no-such-execution");
  } catch (const ExecutionNotFoundError &) {
    threw = true;
  }
  assert(threw);

  assert(fx.service.listExecutions(first).size() == 1);
  assert(fx.service.listExecutions(second).empty());
  threw = false;
  try {
    fx.service.listExecutions("missing");
  } catch (const WorkflowNotFoundError &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ WorkflowService execution scoping test passed\n";
}

void testRegenerate() {
  std::cout << "Testing WorkflowService - regeneration...\n";

  Fixture fx;
  fx.generation->enqueue(GOOD_RESPONSE);
  Workflow workflow = fx.service.createWorkflow("Echo");

  fx.generation->enqueue(IMPROVED_RESPONSE);
  Workflow improved = fx.service.regenerateWorkflow(
      workflow.id, "hello", "Prefix the answer with 'improved'");
  assert(improved.status == WorkflowStatus::READY);
  assert(contains(*improved.generated_code, "improved: "));
  assert(fx.store.getWorkflow(workflow.id)->generated_code ==
         improved.generated_code);

  fx.generation->enqueue("def something_else():\n    pass\n");
  bool threw = false;
  try {
    fx.service.regenerateWorkflowAsync(workflow.id, "hello", "again").get();
  } catch (const CodeValidationError &e) {
    threw = true;
    assert(e.reason() == "missing execute_workflow function");
  }
  assert(threw);
  Workflow failed = *fx.store.getWorkflow(workflow.id);
  assert(failed.status == WorkflowStatus::FAILED);
  assert(failed.generated_code == improved.generated_code &&
         "rejected code never replaces the stored code");
  assert(contains(*failed.error, "Improved code validation failed"));

  // A failed workflow can be repaired by a later regeneration.
  fx.generation->enqueue(IMPROVED_RESPONSE);
  assert(fx.service.regenerateWorkflow(workflow.id, "x", "y").status ==
         WorkflowStatus::READY);

  threw = false;
  try {
    fx.service.regenerateWorkflow("missing", "x", "y");
  } catch (const WorkflowNotFoundError &) {
    threw = true;
  }
  assert(threw);

  std::cout << "✓ WorkflowService regeneration test passed\n";
}

void testHealth() {
  std::cout << "Testing WorkflowService - health...\n";

  Fixture fx;
  fx.storeRunnable();
  json health = fx.service.health();
  assert(health["status"] == "healthy");
  assert(health["generation_available"] == true);
  assert(health["workflows"] == 1);
  assert(health["executions"] == 0);
  assert(health["active_executions"] == 0);
  assert(health["workers"]["total"] == 2);
  assert(health["execution_timeout_seconds"] == 10);

  std::cout << "✓ WorkflowService health test passed\n";
}

void testDispatcherSuccess() {
  std::cout << "Testing RequestDispatcher - successful requests...\n";

  Fixture fx;
  RequestDispatcher dispatcher(fx.service, false);

  fx.generation->enqueue(GOOD_RESPONSE);
  json created = json::parse(dispatcher.handleLine(
      R"({"request_id": 1, "op": "create_workflow", "description": "Echo", "name": "echo"})"));
  assert(created["request_id"] == 1);
  assert(created["ok"] == true);
  assert(created["data"]["status"] == "ready");
  assert(created["data"]["name"] == "echo");

  std::string runnable = fx.storeRunnable();
  json executed = dispatcher.dispatch({{"request_id", "r2"},
                                       {"op", "execute_workflow"},
                                       {"workflow_id", runnable},
                                       {"user_input", "now"},
                                       {"attached_file_ids", json::array({"a"})}});
  assert(executed["ok"] == true);
  assert(executed["data"]["status"] == "completed");
  assert(executed["data"]["result"] == "ran now");
  assert(executed["data"]["attached_file_ids"] == json::array({"a"}));

  std::string executionId = executed["data"]["id"];
  json fetched = dispatcher.dispatch({{"op", "get_execution"},
                                      {"workflow_id", runnable},
                                      {"execution_id", executionId}});
  assert(fetched["ok"] == true);
  assert(fetched["request_id"].is_null());

  json listed = dispatcher.dispatch(
      {{"op", "list_executions"}, {"workflow_id", runnable}});
  assert(listed["data"]["executions"].size() == 1);

  json health = dispatcher.dispatch({{"op", "health"}});
  assert(health["ok"] == true);
  assert(health["data"]["executions"] == 1);

  std::cout << "✓ RequestDispatcher successful requests test passed\n";
}

void testDispatcherErrorCategories() {
  std::cout << "Testing RequestDispatcher - error categories...\n";

  Fixture fx;
  RequestDispatcher dispatcher(fx.service, false);
  auto category = [](const json &response) {
    assert(response["ok"] == false);
    return response["error"]["category"].get<std::string>();
  };

  assert(category(json::parse(dispatcher.handleLine("{not json"))) ==
         "bad_request");
  assert(category(dispatcher.dispatch(json::array())) == "bad_request");
  assert(category(dispatcher.dispatch({{"request_id", 7}})) == "bad_request");
  assert(category(dispatcher.dispatch({{"op", "drop_tables"}})) ==
         "bad_request");
  assert(category(dispatcher.dispatch(
             {{"op", "create_workflow"}, {"description", 12}})) ==
         "bad_request");
  assert(category(dispatcher.dispatch({{"op", "create_workflow_with_files"},
                                       {"description", "x"}})) ==
         "bad_request");
  assert(category(dispatcher.dispatch(
             {{"op", "execute_workflow"}, {"workflow_id", ""},
              {"user_input", "x"}})) == "bad_request");

  json missing = dispatcher.dispatch(
      {{"request_id", "m"}, {"op", "get_workflow"}, {"workflow_id", "nope"}});
  assert(category(missing) == "not_found");
  assert(missing["request_id"] == "m");

  Workflow draft = Workflow::create("draft");
  fx.store.storeWorkflow(draft);
  assert(category(dispatcher.dispatch({{"op", "execute_workflow"},
                                       {"workflow_id", draft.id},
                                       {"user_input", "x"}})) ==
         "bad_request");

  std::string first = fx.storeRunnable();
  std::string second = fx.storeRunnable();
  WorkflowExecution execution = WorkflowExecution::create(first, "x");
  fx.store.storeExecution(execution);
  json mismatch = dispatcher.dispatch({{"op", "get_execution"},
                                       {"workflow_id", second},
                                       {"execution_id", execution.id}});
  assert(category(mismatch) == "bad_request");

  fx.generation->enqueue("print('no entry point')");
  json rejected = dispatcher.dispatch(
      {{"op", "create_workflow"}, {"description", "Echo"}});
  assert(category(rejected) == "generation_failed");
  assert(contains(rejected["error"]["message"].get<std::string>(),
                  "missing execute_workflow function"));

  fx.generation->enqueueError("Generation API error 500: boom");
  assert(category(dispatcher.dispatch(
             {{"op", "create_workflow"}, {"description", "Echo"}})) ==
         "generation_failed");

  fx.generation->enqueue("!crash:secret detail");
  json internal = dispatcher.dispatch(
      {{"op", "create_workflow"}, {"description", "Echo"}});
  assert(category(internal) == "internal");
  assert(internal["error"]["message"] == "Internal server error");

  RequestDispatcher debugDispatcher(fx.service, true);
  fx.generation->enqueue("!crash:secret detail");
  json detailed = debugDispatcher.dispatch(
      {{"op", "create_workflow"}, {"description", "Echo"}});
  assert(category(detailed) == "internal");
  assert(detailed["error"]["message"] == "secret detail");

  WorkflowStore store;
  WorkflowGenerator offline(store, nullptr);
  WorkflowService offlineService(store, offline, fx.executor, fx.pool);
  RequestDispatcher offlineDispatcher(offlineService, false);
  assert(category(offlineDispatcher.dispatch(
             {{"op", "create_workflow"}, {"description", "Echo"}})) ==
         "unavailable");

  std::cout << "✓ RequestDispatcher error categories test passed\n";
}

int main() {
  try {
    testCreateAndFetch();
    testExecutionScoping();
    testRegenerate();
    testHealth();
    testDispatcherSuccess();
    testDispatcherErrorCategories();
    std::cout << "\n✅ All WorkflowService tests passed!\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "❌ Test failed: " << e.what() << "\n";
    return 1;
  }
}
