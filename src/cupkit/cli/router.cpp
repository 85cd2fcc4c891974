#include "cupkit/cli/router.hpp"

#include "archive/archive_packager.hpp"
#include "core/config/root_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/op_error.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "derive/moveset_overrides.hpp"
#include "derive/threat_group_filter.hpp"
#include "derive/zygarde_config.hpp"
#include "lifecycle/cup_lifecycle.hpp"
#include "merge/git_workspace.hpp"
#include "store/cup_store.hpp"
#include "store/formats_registry.hpp"
#include "store/structure_check.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <initializer_list>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace cupkit::cli {

namespace {

using core::errors::OpError;

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitInconsistent = core::errors::ToInt(core::errors::ExitCode::kInconsistent);

constexpr std::string_view kRootFlag = "--root";
constexpr std::string_view kLogLevelFlag = "--log-level";

// One usage text source avoids divergence between help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  cupkit create <name> --cp <500|1500|2500|10000> --definition <file|-> "
         "[--title <title>]\n"
      << "  cupkit clone <old> <new> [--title <title>]\n"
      << "  cupkit rename <old> <new> [--title <title>]\n"
      << "  cupkit delete <name>\n"
      << "  cupkit package <name> [--filedrop <dir>] [--uri-root <url>]\n"
      << "  cupkit threat-group <list.txt> <records.json>\n"
      << "  cupkit import-movesets <name> --cp <500|1500|2500|10000>\n"
      << "  cupkit zygarde (<name> | --archive <zip>) [--snapshot rankings|overrides]\n"
      << "  cupkit resolve-conflicts <worktree>\n"
      << "  cupkit verify <name>\n"
      << "  cupkit list\n"
      << "  cupkit version\n"
      << "global options: --root <data dir> --log-level <"
      << core::logging::ExpectedLogLevelList() << ">\n";
}

// Positionals plus `--flag <value>` pairs. Every flag takes exactly one value
// and may appear once; `--root` and `--log-level` are accepted by every
// command.
struct ParsedArgs {
  std::vector<std::string> positionals;
  std::map<std::string, std::string, std::less<>> flags;

  std::optional<std::string> Flag(std::string_view name) const {
    const auto it = flags.find(name);
    if (it == flags.end()) {
      return std::nullopt;
    }
    return it->second;
  }
};

bool ParseArgs(std::string_view command, const std::vector<std::string_view>& args,
               std::initializer_list<std::string_view> command_flags, ParsedArgs& parsed,
               std::string& error) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    const bool is_flag = token.size() > 1U && token.front() == '-';
    if (!is_flag) {
      parsed.positionals.emplace_back(token);
      continue;
    }

    const bool known = token == kRootFlag || token == kLogLevelFlag ||
                       std::find(command_flags.begin(), command_flags.end(), token) !=
                           command_flags.end();
    if (!known) {
      error = std::string(command) + ": unknown option: " + std::string(token);
      return false;
    }
    if (i + 1 >= args.size()) {
      error = "missing value for " + std::string(token);
      return false;
    }
    if (!parsed.flags.emplace(std::string(token), std::string(args[i + 1])).second) {
      error = "duplicate option: " + std::string(token);
      return false;
    }
    ++i;
  }
  return true;
}

bool ExpectPositionals(std::string_view command, const ParsedArgs& parsed, std::size_t count,
                       std::string_view names, std::string& error) {
  if (parsed.positionals.size() == count) {
    return true;
  }
  error = std::string(command) + " requires exactly " + std::to_string(count) +
          (count == 1U ? " argument: " : " arguments: ") + std::string(names);
  return false;
}

int UsageError(std::string_view message) {
  std::cerr << "error: " << message << '\n';
  return kExitUsage;
}

int ReportOpError(const OpError& error, core::logging::Logger& logger) {
  logger.Error("operation failed", {{"code", core::errors::ToStableErrorCode(error.kind)}});
  std::cerr << "error: " << core::errors::FormatOpError(error) << '\n';
  return core::errors::ToInt(core::errors::ToExitCode(error.kind));
}

// Resolved config and logger shared by every command that touches a data root.
struct CommandContext {
  core::config::RootConfig config;
  core::logging::Logger logger;
};

bool BuildContext(std::string_view command, const ParsedArgs& parsed, CommandContext& context,
                  std::string& error) {
  core::logging::LogLevel level = core::logging::LogLevel::kInfo;
  if (const auto raw_level = parsed.Flag(kLogLevelFlag); raw_level.has_value()) {
    if (!core::logging::ParseLogLevel(*raw_level, level, error)) {
      return false;
    }
  }
  context.logger.SetMinLevel(level);
  context.logger.SetOperation(std::string(command));
  context.config = core::config::ResolveRootConfig(parsed.Flag(kRootFlag),
                                                   parsed.Flag("--filedrop"),
                                                   parsed.Flag("--uri-root"));
  context.logger.SetContext("root", context.config.data_root.string());
  context.logger.Debug("config resolved", {{"filedrop", context.config.filedrop_dir.string()},
                                           {"uri_root", context.config.filedrop_uri}});
  return true;
}

// A mistyped root fails here instead of growing a fresh data tree.
bool RequireDataRoot(const CommandContext& context, OpError& error) {
  return core::config::CheckDataRootExists(context.config, error);
}

bool ReadDefinitionBody(const std::string& source, std::string& body, OpError& error) {
  if (source == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    return true;
  }

  std::error_code ec;
  if (!fs::is_regular_file(source, ec) || ec) {
    return core::errors::Fail(error, core::errors::ErrorKind::kNotFound,
                              "definition file not found: " + source);
  }
  std::string io_error;
  if (!core::ReadTextFile(source, body, io_error)) {
    return core::errors::Fail(error, core::errors::ErrorKind::kIoError, io_error);
  }
  return true;
}

std::string ResolveTitle(const ParsedArgs& parsed, std::string_view codename) {
  if (const auto title = parsed.Flag("--title"); title.has_value()) {
    return *title;
  }
  return lifecycle::DefaultTitleFor(codename);
}

void PrintPaths(std::string_view label, const std::vector<fs::path>& paths) {
  for (const auto& path : paths) {
    std::cout << label << ": " << path.string() << '\n';
  }
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    return UsageError("version does not accept arguments");
  }
  std::cout << "cupkit 0.1.0\n";
  return kExitSuccess;
}

int CommandCreate(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("create", args, {"--title", "--cp", "--definition"}, parsed, error) ||
      !ExpectPositionals("create", parsed, 1, "<name>", error) ||
      !BuildContext("create", parsed, context, error)) {
    return UsageError(error);
  }

  const auto cp = parsed.Flag("--cp");
  const auto definition = parsed.Flag("--definition");
  if (!cp.has_value() || !definition.has_value()) {
    return UsageError("create requires --cp <500|1500|2500|10000> and --definition <file|->");
  }

  lifecycle::CreateRequest request;
  request.codename = parsed.positionals.front();
  request.title = ResolveTitle(parsed, request.codename);
  if (!store::ParseCpTier(*cp, request.cp_tier, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error) ||
      !ReadDefinitionBody(*definition, request.definition_body, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  lifecycle::CupLifecycleManager manager(store::CupStore(context.config.data_root),
                                         context.logger);
  std::vector<fs::path> written;
  if (!manager.Create(request, written, op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  PrintPaths("written", written);
  return kExitSuccess;
}

int CommandClone(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("clone", args, {"--title"}, parsed, error) ||
      !ExpectPositionals("clone", parsed, 2, "<old> <new>", error) ||
      !BuildContext("clone", parsed, context, error)) {
    return UsageError(error);
  }

  const std::string& old_codename = parsed.positionals[0];
  const std::string& new_codename = parsed.positionals[1];
  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  lifecycle::CupLifecycleManager manager(store::CupStore(context.config.data_root),
                                         context.logger);
  std::vector<fs::path> written;
  if (!manager.Clone(old_codename, new_codename, ResolveTitle(parsed, new_codename), written,
                     op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  PrintPaths("written", written);
  return kExitSuccess;
}

int CommandRename(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("rename", args, {"--title"}, parsed, error) ||
      !ExpectPositionals("rename", parsed, 2, "<old> <new>", error) ||
      !BuildContext("rename", parsed, context, error)) {
    return UsageError(error);
  }

  const std::string& old_codename = parsed.positionals[0];
  const std::string& new_codename = parsed.positionals[1];
  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  lifecycle::CupLifecycleManager manager(store::CupStore(context.config.data_root),
                                         context.logger);
  std::vector<fs::path> moved;
  if (!manager.Rename(old_codename, new_codename, ResolveTitle(parsed, new_codename), moved,
                      op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  PrintPaths("moved", moved);
  return kExitSuccess;
}

int CommandDelete(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("delete", args, {}, parsed, error) ||
      !ExpectPositionals("delete", parsed, 1, "<name>", error) ||
      !BuildContext("delete", parsed, context, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  lifecycle::CupLifecycleManager manager(store::CupStore(context.config.data_root),
                                         context.logger);
  std::vector<fs::path> removed;
  if (!manager.Delete(parsed.positionals.front(), removed, op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  if (removed.empty()) {
    std::cout << "nothing to remove: " << parsed.positionals.front() << '\n';
  }
  PrintPaths("removed", removed);
  return kExitSuccess;
}

int CommandPackage(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("package", args, {"--filedrop", "--uri-root"}, parsed, error) ||
      !ExpectPositionals("package", parsed, 1, "<name>", error) ||
      !BuildContext("package", parsed, context, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  const store::CupStore cup_store(context.config.data_root);
  const archive::ArchivePackager packager(cup_store, context.logger);
  archive::PackageResult result;
  if (!packager.Package(parsed.positionals.front(), context.config.filedrop_dir,
                        context.config.filedrop_uri, result, op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  std::cout << "archive: " << result.archive_path.string() << '\n';
  std::cout << "url: " << result.url << '\n';
  return kExitSuccess;
}

int CommandThreatGroup(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("threat-group", args, {}, parsed, error) ||
      !ExpectPositionals("threat-group", parsed, 2, "<list.txt> <records.json>", error) ||
      !BuildContext("threat-group", parsed, context, error)) {
    return UsageError(error);
  }

  core::json::Value filtered;
  OpError op_error;
  if (!derive::FilterThreatGroupFiles(parsed.positionals[0], parsed.positionals[1], filtered,
                                      op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  context.logger.Info("threat group filtered",
                      {{"matched", std::to_string(filtered.array_value.size())}});
  std::cout << core::json::Serialize(filtered);
  return kExitSuccess;
}

int CommandImportMovesets(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("import-movesets", args, {"--cp"}, parsed, error) ||
      !ExpectPositionals("import-movesets", parsed, 1, "<name>", error) ||
      !BuildContext("import-movesets", parsed, context, error)) {
    return UsageError(error);
  }

  const auto cp = parsed.Flag("--cp");
  if (!cp.has_value()) {
    return UsageError("import-movesets requires --cp <500|1500|2500|10000>");
  }
  store::CpTier tier = store::CpTier::k1500;
  if (!store::ParseCpTier(*cp, tier, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  const store::CupStore cup_store(context.config.data_root);
  core::json::Value overrides;
  if (!derive::ImportMovesets(cup_store, parsed.positionals.front(), tier, overrides, op_error)) {
    return ReportOpError(op_error, context.logger);
  }
  context.logger.Info("movesets imported",
                      {{"cup", parsed.positionals.front()},
                       {"cp", *cp},
                       {"records", std::to_string(overrides.array_value.size())}});
  std::cout << core::json::Serialize(overrides, "    ");
  return kExitSuccess;
}

int CommandZygarde(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("zygarde", args, {"--archive", "--snapshot"}, parsed, error) ||
      !BuildContext("zygarde", parsed, context, error)) {
    return UsageError(error);
  }

  const auto archive_path = parsed.Flag("--archive");
  const std::size_t expected_positionals = archive_path.has_value() ? 0U : 1U;
  if (parsed.positionals.size() != expected_positionals) {
    return UsageError("zygarde requires exactly one of <name> or --archive <zip>");
  }

  derive::SnapshotKind kind = derive::SnapshotKind::kRankings;
  if (const auto snapshot = parsed.Flag("--snapshot"); snapshot.has_value()) {
    if (!derive::ParseSnapshotKind(*snapshot, kind, error)) {
      return UsageError(error);
    }
  }

  derive::ZygardeConfig zygarde;
  OpError op_error;
  bool ok = false;
  if (archive_path.has_value()) {
    ok = derive::GenerateFromArchive(*archive_path, kind, zygarde, op_error, context.logger);
  } else if (RequireDataRoot(context, op_error)) {
    const store::CupStore cup_store(context.config.data_root);
    ok = derive::GenerateFromStore(cup_store, parsed.positionals.front(), kind, zygarde,
                                   op_error, context.logger);
  }
  if (!ok) {
    return ReportOpError(op_error, context.logger);
  }
  std::cout << derive::ToJson(zygarde);
  return kExitSuccess;
}

int CommandResolveConflicts(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("resolve-conflicts", args, {}, parsed, error) ||
      !ExpectPositionals("resolve-conflicts", parsed, 1, "<worktree>", error) ||
      !BuildContext("resolve-conflicts", parsed, context, error)) {
    return UsageError(error);
  }

  merge::GitWorkspace workspace;
  OpError op_error;
  if (!workspace.Open(parsed.positionals.front(), op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  merge::ResolveReport report;
  const bool ok = merge::ResolveConflicts(workspace, report, op_error, context.logger);
  for (const auto& resolution : report.applied) {
    std::cout << "resolved: " << resolution.path << ' ' << merge::ToString(resolution.action)
              << '\n';
  }
  for (const auto& backup : report.backups) {
    std::cout << "backup: " << backup << '\n';
  }
  if (!ok) {
    return ReportOpError(op_error, context.logger);
  }
  if (report.applied.empty()) {
    std::cout << "no conflicts\n";
  }
  return kExitSuccess;
}

int CommandVerify(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("verify", args, {}, parsed, error) ||
      !ExpectPositionals("verify", parsed, 1, "<name>", error) ||
      !BuildContext("verify", parsed, context, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  const store::CupStore cup_store(context.config.data_root);
  store::StructureReport report;
  if (!store::CheckCupStructure(cup_store, parsed.positionals.front(), report, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  for (const auto& issue : report.issues) {
    std::cout << store::ToString(issue.severity) << ": " << issue.path << ": " << issue.message
              << '\n';
  }
  if (report.HasErrors()) {
    std::cout << "inconsistent: " << report.codename << " (" << report.ErrorCount()
              << " errors, " << report.WarningCount() << " warnings)\n";
    return kExitInconsistent;
  }
  std::cout << "ok: " << report.codename << " (" << report.WarningCount() << " warnings)\n";
  return kExitSuccess;
}

int CommandList(const std::vector<std::string_view>& args) {
  ParsedArgs parsed;
  std::string error;
  CommandContext context;
  if (!ParseArgs("list", args, {}, parsed, error) ||
      !ExpectPositionals("list", parsed, 0, "(none)", error) ||
      !BuildContext("list", parsed, context, error)) {
    return UsageError(error);
  }

  OpError op_error;
  if (!RequireDataRoot(context, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  const store::CupStore cup_store(context.config.data_root);
  store::FormatsRegistry registry;
  if (!store::FormatsRegistry::Load(cup_store.FormatsRegistryPath(), registry, op_error)) {
    return ReportOpError(op_error, context.logger);
  }

  for (const auto& entry : registry.List()) {
    const core::json::Value* cp = core::json::FindField(entry, store::kEntryCpField);
    std::cout << core::json::StringField(entry, store::kEntryCupField) << '\t'
              << core::json::StringField(entry, store::kEntryTitleField) << '\t'
              << (cp != nullptr ? core::json::Serialize(*cp, "") : std::string("-")) << '\n';
  }
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "create") {
    return CommandCreate(args);
  }
  if (command == "clone") {
    return CommandClone(args);
  }
  if (command == "rename") {
    return CommandRename(args);
  }
  if (command == "delete") {
    return CommandDelete(args);
  }
  if (command == "package") {
    return CommandPackage(args);
  }
  if (command == "threat-group") {
    return CommandThreatGroup(args);
  }
  if (command == "import-movesets") {
    return CommandImportMovesets(args);
  }
  if (command == "zygarde") {
    return CommandZygarde(args);
  }
  if (command == "resolve-conflicts") {
    return CommandResolveConflicts(args);
  }
  if (command == "verify") {
    return CommandVerify(args);
  }
  if (command == "list") {
    return CommandList(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace cupkit::cli
