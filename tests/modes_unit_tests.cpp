#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include "core/errors.hpp"
#include "modes/builtin_modes.hpp"
#include "modes/loader.hpp"
#include "modes/mode.hpp"
#include "modes/policy.hpp"
#include "modes/registry.hpp"
#include "modes/task.hpp"

using mode_server::core::ErrorCode;
using mode_server::core::ErrorKind;
using mode_server::core::RpcError;
using mode_server::modes::Mode;
using mode_server::modes::ModeDefinition;
using mode_server::modes::ModeLoader;
using mode_server::modes::ModeRegistry;
using mode_server::modes::ModeSource;
using mode_server::modes::PolicyEngine;
using mode_server::modes::Task;
using mode_server::modes::TaskState;
using mode_server::modes::ToolGroup;
using mode_server::modes::builtin_modes;
using mode_server::modes::make_group;

namespace {

int fail(const char* name, const char* msg) {
  std::cerr << "[FAIL] " << name << ": " << msg << '\n';
  return 1;
}

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
  try {
    fn();
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

Mode solo_mode() {
  return Mode(ModeDefinition{
      .slug = "solo",
      .name = "Solo",
      .role_definition = "You work alone.",
      .groups = {make_group(ToolGroup::read), make_group(ToolGroup::edit)},
  });
}

std::filesystem::path make_temp_dir(const char* name) {
  const auto dir = std::filesystem::temp_directory_path() / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

int test_mode_rejects_invalid_definitions() {
  const char* name = "test_mode_rejects_invalid_definitions";

  if (!throws_invalid_argument([] { (void)Mode(ModeDefinition{.slug = "bad slug!", .name = "X", .role_definition = "r"}); })) {
    return fail(name, "slug with spaces should be rejected");
  }
  if (!throws_invalid_argument(
          [] { (void)Mode(ModeDefinition{.slug = std::string(51, 'a'), .name = "X", .role_definition = "r"}); })) {
    return fail(name, "slug longer than 50 characters should be rejected");
  }
  if (!throws_invalid_argument([] { (void)Mode(ModeDefinition{.slug = "ok", .name = "", .role_definition = "r"}); })) {
    return fail(name, "empty name should be rejected");
  }
  if (!throws_invalid_argument([] { (void)Mode(ModeDefinition{.slug = "ok", .name = "Ok", .role_definition = ""}); })) {
    return fail(name, "empty role definition should be rejected");
  }
  if (!throws_invalid_argument([] {
        (void)Mode(ModeDefinition{.slug = "ok",
                            .name = "Ok",
                            .role_definition = "r",
                            .groups = {make_group(ToolGroup::read), make_group(ToolGroup::read)}});
      })) {
    return fail(name, "duplicate groups should be rejected");
  }
  if (!throws_invalid_argument([] { (void)make_group(ToolGroup::edit, "([unclosed"); })) {
    return fail(name, "uncompilable file pattern should be rejected at construction");
  }

  return 0;
}

int test_builtin_modes_and_file_patterns() {
  const char* name = "test_builtin_modes_and_file_patterns";
  const auto modes = builtin_modes();
  if (modes.size() != 5) {
    return fail(name, "expected five builtin modes");
  }

  const ModeRegistry registry(builtin_modes());
  const auto architect = registry.find("architect");
  if (architect == nullptr) {
    return fail(name, "architect mode missing");
  }
  if (!architect->can_edit_file("README.md") || !architect->can_edit_file("docs/guide.md")) {
    return fail(name, "architect should edit markdown files");
  }
  if (architect->can_edit_file("app.py")) {
    return fail(name, "architect should not edit python files");
  }

  const auto ask = registry.find("ask");
  if (ask == nullptr || ask->is_group_enabled(ToolGroup::edit) || ask->can_edit_file("README.md")) {
    return fail(name, "ask mode must not edit files");
  }

  const auto code = registry.find("code");
  if (code == nullptr || !code->can_edit_file("src/anything.cpp")) {
    return fail(name, "code mode edits without restriction");
  }

  if (registry.slug_list() != "architect, ask, code, debug, orchestrator") {
    return fail(name, "slug list should be sorted and comma separated");
  }

  return 0;
}

int test_registry_duplicates_and_reload() {
  const char* name = "test_registry_duplicates_and_reload";

  if (!throws_invalid_argument([] {
        std::vector<Mode> modes;
        modes.push_back(solo_mode());
        modes.push_back(solo_mode());
        ModeRegistry registry(std::move(modes));
      })) {
    return fail(name, "duplicate slugs should be rejected");
  }

  ModeRegistry registry(builtin_modes());
  const auto before = registry.snapshot();

  std::vector<Mode> replacement;
  replacement.push_back(solo_mode());
  registry.reload(std::move(replacement));

  if (registry.size() != 1 || !registry.contains("solo") || registry.contains("code")) {
    return fail(name, "reload should replace the whole table");
  }
  if (before->size() != 5 || before->find("code") == before->end()) {
    return fail(name, "an earlier snapshot must stay intact after reload");
  }

  return 0;
}

int test_loader_precedence_and_bad_entries() {
  const char* name = "test_loader_precedence_and_bad_entries";
  const auto global_dir = make_temp_dir("mode_server_global_modes");
  const auto project_dir = make_temp_dir("mode_server_project_modes");

  {
    std::ofstream out(global_dir / "modes.json");
    out << R"({"customModes": [
      {"slug": "code", "name": "Global Code", "roleDefinition": "Global coder.", "groups": ["read", "command"]},
      {"slug": "docs", "name": "Docs", "roleDefinition": "Global docs.", "groups": ["read"]}
    ]})";
  }
  {
    std::ofstream out(project_dir / ".modes.json");
    out << R"({"customModes": [
      {"slug": "docs", "name": "Project Docs", "roleDefinition": "Writes docs.",
       "groups": ["read", ["edit", {"fileRegex": "\\.md$", "description": "Markdown"}], "mcp", "modes"]},
      {"slug": "broken", "name": "Broken", "roleDefinition": "x", "groups": [["edit", {"fileRegex": "(["}]]},
      {"slug": "nameless", "roleDefinition": "x"}
    ]})";
  }

  const ModeLoader loader(global_dir.string(), project_dir.string());
  const ModeRegistry registry(loader.load_all());

  std::filesystem::remove_all(global_dir);
  std::filesystem::remove_all(project_dir);

  if (registry.contains("broken") || registry.contains("nameless")) {
    return fail(name, "invalid entries should be skipped");
  }
  if (registry.size() != 6) {
    return fail(name, "expected five builtin modes plus docs");
  }

  const auto code = registry.find("code");
  if (code == nullptr || code->name() != "Global Code" || code->source() != ModeSource::global) {
    return fail(name, "global file should override builtin code mode");
  }

  const auto docs = registry.find("docs");
  if (docs == nullptr || docs->name() != "Project Docs" || docs->source() != ModeSource::project) {
    return fail(name, "project file should override global docs mode");
  }
  if (!docs->is_group_enabled(ToolGroup::integration) || !docs->is_group_enabled(ToolGroup::delegation)) {
    return fail(name, "mcp and modes aliases should map to integration and delegation");
  }
  if (!docs->can_edit_file("guide.md") || docs->can_edit_file("main.cpp")) {
    return fail(name, "project docs mode should be restricted to markdown");
  }

  const auto slugs = registry.slugs();
  for (std::size_t i = 1; i < slugs.size(); ++i) {
    if (slugs[i - 1] >= slugs[i]) {
      return fail(name, "merged modes should be sorted by slug");
    }
  }

  return 0;
}

int test_loader_missing_and_unparsable_files() {
  const char* name = "test_loader_missing_and_unparsable_files";
  const auto project_dir = make_temp_dir("mode_server_unparsable_modes");
  {
    std::ofstream out(project_dir / ".modes.json");
    out << "{ not json";
  }

  const ModeLoader loader((project_dir / "does-not-exist").string(), project_dir.string());
  const auto modes = loader.load_all();
  std::filesystem::remove_all(project_dir);

  if (modes.size() != 5) {
    return fail(name, "missing and unparsable files should leave only builtin modes");
  }
  return 0;
}

int test_policy_tool_decisions() {
  const char* name = "test_policy_tool_decisions";
  const ModeRegistry registry(builtin_modes());
  const PolicyEngine policy(registry);

  const Task ask_task("ask");
  const auto denied = policy.validate_tool_use(ask_task, "write_to_file", {{"path", "README.md"}});
  if (denied.allowed || denied.code != ErrorCode::tool_restriction_error) {
    return fail(name, "ask mode should deny write_to_file with TOOL_RESTRICTION_ERROR");
  }
  if (denied.reason != "Tool 'write_to_file' is not available in mode 'Ask'") {
    return fail(name, "tool restriction reason text mismatch");
  }

  const Task architect_task("architect");
  if (!policy.validate_tool_use(architect_task, "write_to_file", {{"path", "README.md"}}).allowed) {
    return fail(name, "architect should write markdown files");
  }
  const auto file_denied = policy.validate_tool_use(architect_task, "write_to_file", {{"path", "app.py"}});
  if (file_denied.allowed || file_denied.code != ErrorCode::file_restriction_error) {
    return fail(name, "architect should be denied app.py with FILE_RESTRICTION_ERROR");
  }
  if (file_denied.reason.find(R"(\.md$)") == std::string::npos) {
    return fail(name, "file restriction reason should name the pattern");
  }

  const Task code_task("code");
  if (!policy.validate_tool_use(code_task, "apply_diff", {{"path", "app.py"}}).allowed) {
    return fail(name, "code mode should edit any file");
  }
  if (policy.can_use_tool(code_task, "format_disk")) {
    return fail(name, "unknown tools should be denied");
  }
  if (!policy.can_use_tool(Task("orchestrator"), "attempt_completion")) {
    return fail(name, "always-allowed tools should pass in every mode");
  }
  if (!policy.can_use_tool(Task("ghost"), "execute_command") || !policy.can_edit_file(Task("ghost"), "x.py")) {
    return fail(name, "unknown modes should fail open");
  }

  return 0;
}

int test_system_prompt_sections() {
  const char* name = "test_system_prompt_sections";
  const ModeRegistry registry(builtin_modes());
  const PolicyEngine policy(registry);

  const std::string prompt = policy.system_prompt(Task("architect"));
  const auto instructions = prompt.find("\n\n## Mode Instructions\n\n");
  const auto when_to_use = prompt.find("\n\n## When to Use This Mode\n\n");
  const auto groups = prompt.find("\n\n## Available Tool Groups\n\n");
  if (instructions == std::string::npos || when_to_use == std::string::npos || groups == std::string::npos) {
    return fail(name, "architect prompt should contain all three sections");
  }
  if (!(instructions < when_to_use && when_to_use < groups)) {
    return fail(name, "prompt sections out of order");
  }
  if (prompt.find(R"(edit (restricted to: \.md$))") == std::string::npos) {
    return fail(name, "restricted group should show its pattern");
  }

  if (policy.system_prompt_for("ghost") != "You are a helpful AI assistant.") {
    return fail(name, "unknown mode should produce the fallback prompt");
  }

  return 0;
}

int test_create_task_and_delegation() {
  const char* name = "test_create_task_and_delegation";
  std::vector<Mode> modes = builtin_modes();
  modes.push_back(solo_mode());
  const ModeRegistry registry(std::move(modes));
  const PolicyEngine policy(registry);

  const auto missing = policy.create_task("ghost");
  const auto* missing_error = std::get_if<RpcError>(&missing);
  if (missing_error == nullptr || missing_error->kind != ErrorKind::validation) {
    return fail(name, "unknown mode should fail with a validation error");
  }
  if (missing_error->data.get<std::string>().find("architect, ask, code") == std::string::npos) {
    return fail(name, "unknown mode error should list available modes");
  }

  auto created = policy.create_task("orchestrator", "plan the release");
  auto* parent = std::get_if<Task>(&created);
  if (parent == nullptr || parent->state() != TaskState::pending || parent->messages().size() != 1) {
    return fail(name, "task should start pending with the initial user message");
  }

  const auto child = policy.create_task("code", {}, parent);
  const auto* child_task = std::get_if<Task>(&child);
  if (child_task == nullptr || child_task->parent_task_id() != parent->id()) {
    return fail(name, "child task should record its parent");
  }
  if (parent->child_task_ids().size() != 1 || parent->child_task_ids().front() != child_task->id()) {
    return fail(name, "parent should record the child id");
  }

  auto solo_created = policy.create_task("solo");
  auto* solo_parent = std::get_if<Task>(&solo_created);
  const auto denied = policy.create_task("code", {}, solo_parent);
  const auto* denied_error = std::get_if<RpcError>(&denied);
  if (denied_error == nullptr || denied_error->code != ErrorCode::tool_restriction_error) {
    return fail(name, "a parent without delegation should not spawn children");
  }
  if (!solo_parent->child_task_ids().empty()) {
    return fail(name, "denied delegation must not touch the parent");
  }

  return 0;
}

int test_switch_mode_rules() {
  const char* name = "test_switch_mode_rules";
  std::vector<Mode> modes = builtin_modes();
  modes.push_back(solo_mode());
  const ModeRegistry registry(std::move(modes));
  const PolicyEngine policy(registry);

  Task task("code");
  if (auto error = policy.switch_mode(task, "ghost"); !error.has_value() || error->kind != ErrorKind::validation) {
    return fail(name, "switching to an unknown mode should be a validation error");
  }
  if (policy.switch_mode(task, "ask").has_value()) {
    return fail(name, "code -> ask should succeed");
  }
  if (task.mode_slug() != "ask" || task.messages().empty()) {
    return fail(name, "switch should update the slug and append a message");
  }
  const auto& audit = task.messages().back();
  if (audit.role != "system" || audit.content != "Mode switched from code to ask" ||
      audit.metadata["mode_change"]["from"] != "code" || audit.metadata["mode_change"]["to"] != "ask") {
    return fail(name, "audit message content mismatch");
  }

  Task solo("solo");
  const auto denied = policy.switch_mode(solo, "code");
  if (!denied.has_value() || denied->code != ErrorCode::tool_restriction_error || solo.mode_slug() != "solo") {
    return fail(name, "a mode without delegation should not switch");
  }

  Task finished("code");
  (void)finished.finish(TaskState::completed);
  if (!policy.switch_mode(finished, "ask").has_value()) {
    return fail(name, "a terminal task should not switch modes");
  }

  return 0;
}

int test_task_state_machine() {
  const char* name = "test_task_state_machine";

  Task task("code");
  if (task.state() != TaskState::pending || task.completed_at().has_value()) {
    return fail(name, "new task should be pending without completion time");
  }
  if (!task.mark_running() || task.mark_running()) {
    return fail(name, "mark_running should only move pending -> running");
  }
  if (task.finish(TaskState::running)) {
    return fail(name, "finish should reject non-terminal targets");
  }
  if (!task.finish(TaskState::failed) || task.state() != TaskState::failed || !task.completed_at().has_value()) {
    return fail(name, "running -> failed should set completed_at");
  }
  if (task.finish(TaskState::completed) || task.state() != TaskState::failed) {
    return fail(name, "terminal states are final");
  }

  Task pending("ask");
  if (!pending.finish(TaskState::cancelled) || pending.state() != TaskState::cancelled) {
    return fail(name, "pending task should be finishable");
  }

  const auto json = pending.to_json();
  if (json["state"] != "cancelled" || !json["parent_task_id"].is_null() || json["completed_at"].is_null()) {
    return fail(name, "task json fields mismatch");
  }
  if (json["task_id"].get<std::string>().size() != 36) {
    return fail(name, "task id should be uuid shaped");
  }

  return 0;
}

}  // namespace

int main() {
  if (int rc = test_mode_rejects_invalid_definitions(); rc != 0) return rc;
  if (int rc = test_builtin_modes_and_file_patterns(); rc != 0) return rc;
  if (int rc = test_registry_duplicates_and_reload(); rc != 0) return rc;
  if (int rc = test_loader_precedence_and_bad_entries(); rc != 0) return rc;
  if (int rc = test_loader_missing_and_unparsable_files(); rc != 0) return rc;
  if (int rc = test_policy_tool_decisions(); rc != 0) return rc;
  if (int rc = test_system_prompt_sections(); rc != 0) return rc;
  if (int rc = test_create_task_and_delegation(); rc != 0) return rc;
  if (int rc = test_switch_mode_rules(); rc != 0) return rc;
  if (int rc = test_task_state_machine(); rc != 0) return rc;

  std::cout << "[PASS] modes unit tests\n";
  return 0;
}
