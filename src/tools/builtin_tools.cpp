#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "exec/text_decoding.hpp"

namespace sous::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;
using protocol::ToolResult;

namespace {

core::errors::Result<json> parse_arguments(const std::string& tool_name,
                                           const std::string& arguments_json) {
    const std::string text = arguments_json.empty() ? "{}" : arguments_json;
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return AgentError{ErrorCategory::Input,
                          "Arguments for '" + tool_name + "' are not a JSON object: " + text,
                          "invalid_tool_arguments"};
    }
    return doc;
}

core::errors::Result<std::string> require_string(const std::string& tool_name,
                                                 const json& args, const char* key) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_string()) {
        return AgentError{ErrorCategory::Input,
                          "'" + tool_name + "' requires a string '" + key + "' argument.",
                          "invalid_tool_arguments"};
    }
    return it->get<std::string>();
}

core::errors::Status require_keys(const std::string& tool_name,
                                  const std::string& arguments_json,
                                  const std::vector<const char*>& keys) {
    auto parsed = parse_arguments(tool_name, arguments_json);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    for (const char* key : keys) {
        auto value = require_string(tool_name, core::errors::get_value(parsed), key);
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
    }
    return core::errors::ok();
}

// An absent timeout means the executor default; present values must lie in
// [1, UINT32_MAX] milliseconds.
core::errors::Result<std::optional<std::uint32_t>> optional_timeout(
    const std::string& tool_name, const json& args) {
    auto it = args.find("timeout_ms");
    if (it == args.end() || it->is_null()) {
        return std::optional<std::uint32_t>{};
    }
    std::uint64_t value = 0;
    if (it->is_number_unsigned()) {
        value = it->get<std::uint64_t>();
    } else if (it->is_number_integer() && it->get<std::int64_t>() > 0) {
        value = static_cast<std::uint64_t>(it->get<std::int64_t>());
    }
    if (value == 0 || value > std::numeric_limits<std::uint32_t>::max()) {
        return AgentError{ErrorCategory::Input,
                          "'" + tool_name + "' requires 'timeout_ms' between 1 and " +
                              std::to_string(std::numeric_limits<std::uint32_t>::max()) + ".",
                          "invalid_tool_arguments"};
    }
    return std::optional<std::uint32_t>(static_cast<std::uint32_t>(value));
}

std::size_t size_or(const json& args, const char* key, const std::size_t fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_number_unsigned()) {
        return fallback;
    }
    return it->get<std::size_t>();
}

bool bool_or(const json& args, const char* key, const bool fallback) {
    auto it = args.find(key);
    if (it == args.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

double elapsed_ms_since(const std::chrono::steady_clock::time_point started) {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
        .count();
}

ToolResult failure(const std::string& message, const double duration_ms = 0.0) {
    ToolResult result;
    result.success = false;
    result.error_message = message;
    result.duration_ms = duration_ms;
    return result;
}

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }

    constexpr std::size_t kProbeSize = 1024;
    char buffer[kProbeSize];
    in.read(buffer, static_cast<std::streamsize>(kProbeSize));
    const std::streamsize read_bytes = in.gcount();
    for (std::streamsize i = 0; i < read_bytes; ++i) {
        if (buffer[i] == '\0') {
            return true;
        }
    }
    return false;
}

std::string trim_line(const std::string& line) {
    constexpr std::size_t kMaxLineLength = 240;
    if (line.size() <= kMaxLineLength) {
        return line;
    }
    return line.substr(0, kMaxLineLength) + "...";
}

bool is_hidden(const std::filesystem::path& path) {
    const std::string name = path.filename().string();
    return name.size() > 1 && name[0] == '.' && name != "..";
}

}  // namespace

// ---- bash -----------------------------------------------------------------

BashTool::BashTool(std::shared_ptr<exec::SecureCommandExecutor> executor,
                   policy::CommandPermissionClassifier classifier)
    : executor_(std::move(executor)), classifier_(std::move(classifier)) {}

std::string BashTool::description() const {
    return "Run a non-interactive command in the workspace. `cd` changes the "
           "directory for later commands.";
}

std::string BashTool::parameters_schema() const {
    return R"({"type":"object","properties":{"command":{"type":"string"},)"
           R"("timeout_ms":{"type":"integer","minimum":1}},"required":["command"]})";
}

core::errors::Status BashTool::validate(const std::string& arguments_json) const {
    auto parsed = parse_arguments(name(), arguments_json);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& args = core::errors::get_value(parsed);
    auto command = require_string(name(), args, "command");
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    auto timeout_ms = optional_timeout(name(), args);
    if (core::errors::is_error(timeout_ms)) {
        return core::errors::get_error(timeout_ms);
    }
    return core::errors::ok();
}

std::optional<protocol::ToolPermission> BashTool::permission(
    const std::string& arguments_json) const {
    auto parsed = parse_arguments(name(), arguments_json);
    if (core::errors::is_error(parsed)) {
        return protocol::ToolPermission::Ask;
    }
    auto command = require_string(name(), core::errors::get_value(parsed), "command");
    if (core::errors::is_error(command)) {
        return protocol::ToolPermission::Ask;
    }
    return classifier_.classify(core::errors::get_value(command));
}

core::errors::Result<ToolResult> BashTool::execute(const std::string& arguments_json,
                                                   const ToolContext& context) {
    auto parsed = parse_arguments(name(), arguments_json);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& args = core::errors::get_value(parsed);
    auto command = require_string(name(), args, "command");
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }

    auto timeout_ms = optional_timeout(name(), args);
    if (core::errors::is_error(timeout_ms)) {
        return core::errors::get_error(timeout_ms);
    }

    auto output = executor_->execute(core::errors::get_value(command),
                                     core::errors::get_value(timeout_ms), {},
                                     context.cancel_token);
    if (core::errors::is_error(output)) {
        return core::errors::get_error(output);
    }
    const auto& captured = core::errors::get_value(output);

    ToolResult result;
    result.output = captured.stdout_text;
    result.duration_ms = captured.duration_ms;
    result.success = captured.exit_code == 0;
    if (!result.success) {
        result.error_message = "Command failed with exit code " +
                               std::to_string(captured.exit_code);
        if (!captured.stderr_text.empty()) {
            result.error_message += "\n" + captured.stderr_text;
        }
    } else if (!captured.stderr_text.empty()) {
        result.output += (result.output.empty() ? "" : "\n") + std::string("[stderr]\n") +
                         captured.stderr_text;
    }
    return result;
}

void BashTool::reset() {
    executor_->reset_workdir();
}

// ---- read_file ------------------------------------------------------------

ReadFileTool::ReadFileTool(policy::WorkspaceGuard guard) : guard_(std::move(guard)) {}

std::string ReadFileTool::description() const {
    return "Read a text file from the workspace, optionally a line range.";
}

std::string ReadFileTool::parameters_schema() const {
    return R"({"type":"object","properties":{"path":{"type":"string"},)"
           R"("offset":{"type":"integer","minimum":0},"limit":{"type":"integer","minimum":1}},)"
           R"("required":["path"]})";
}

core::errors::Status ReadFileTool::validate(const std::string& arguments_json) const {
    return require_keys(name(), arguments_json, {"path"});
}

core::errors::Result<ToolResult> ReadFileTool::execute(const std::string& arguments_json,
                                                       const ToolContext& context) {
    static_cast<void>(context);
    const auto started = std::chrono::steady_clock::now();
    auto parsed = parse_arguments(name(), arguments_json);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& args = core::errors::get_value(parsed);
    auto path = require_string(name(), args, "path");
    if (core::errors::is_error(path)) {
        return core::errors::get_error(path);
    }
    auto resolved = guard_.resolve(core::errors::get_value(path));
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(file_path, ec) || ec) {
        return failure("File does not exist: " + file_path.string());
    }
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return failure("Path is not a regular file: " + file_path.string());
    }
    if (is_probably_binary(file_path)) {
        return failure("Refusing to read binary file: " + file_path.string());
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return failure("Failed to open file: " + file_path.string());
    }

    const std::size_t offset = size_or(args, "offset", 0);
    const std::size_t limit = size_or(args, "limit", 0);
    std::ostringstream buffer;
    std::string line;
    std::size_t line_no = 0;
    std::size_t emitted = 0;
    while (std::getline(in, line)) {
        if (line_no++ < offset) {
            continue;
        }
        if (limit > 0 && emitted >= limit) {
            break;
        }
        buffer << line << "\n";
        ++emitted;
    }
    if (in.bad()) {
        return failure("I/O error while reading file: " + file_path.string());
    }

    ToolResult result;
    result.success = true;
    result.output = exec::decode_utf8_lossy(buffer.str());
    result.duration_ms = elapsed_ms_since(started);
    return result;
}

// ---- grep -----------------------------------------------------------------

GrepTool::GrepTool(policy::WorkspaceGuard guard) : guard_(std::move(guard)) {}

std::string GrepTool::description() const {
    return "Search workspace files for a literal pattern. Returns path:line:text.";
}

std::string GrepTool::parameters_schema() const {
    return R"({"type":"object","properties":{"pattern":{"type":"string"},)"
           R"("path":{"type":"string"},"max_matches":{"type":"integer","minimum":1}},)"
           R"("required":["pattern"]})";
}

core::errors::Status GrepTool::validate(const std::string& arguments_json) const {
    auto status = require_keys(name(), arguments_json, {"pattern"});
    if (core::errors::is_error(status)) {
        return status;
    }
    const auto args = json::parse(arguments_json, nullptr, false);
    if (args.at("pattern").get<std::string>().empty()) {
        return AgentError{ErrorCategory::Input, "Search pattern cannot be empty.",
                          "empty_search_pattern"};
    }
    return core::errors::ok();
}

core::errors::Result<ToolResult> GrepTool::execute(const std::string& arguments_json,
                                                   const ToolContext& context) {
    const auto started = std::chrono::steady_clock::now();
    auto valid = validate(arguments_json);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    const json args = json::parse(arguments_json);
    const std::string pattern = args.at("pattern").get<std::string>();
    const std::string scope =
        args.contains("path") && args.at("path").is_string() ? args.at("path").get<std::string>()
                                                             : std::string(".");
    const std::size_t max_matches = std::max<std::size_t>(1, size_or(args, "max_matches", 50));

    auto resolved = guard_.resolve(scope);
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path scope_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::exists(scope_path, ec) || ec) {
        return failure("Scope does not exist: " + scope_path.string());
    }

    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_regular_file(scope_path, ec) && !ec) {
        files.push_back(scope_path);
    } else if (std::filesystem::is_directory(scope_path, ec) && !ec) {
        const auto options = std::filesystem::directory_options::skip_permission_denied;
        auto it = std::filesystem::recursive_directory_iterator(scope_path, options, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (is_hidden(it->path())) {
                if (it->is_directory(ec)) {
                    it.disable_recursion_pending();
                }
                continue;
            }
            if (it->is_regular_file(ec) && !ec) {
                files.push_back(it->path());
            }
        }
    } else {
        return failure("Scope is neither a file nor directory: " + scope_path.string());
    }

    constexpr std::uintmax_t kMaxFileBytes = 1024 * 1024;
    const auto root = guard_.resolve(".");
    std::ostringstream out;
    std::size_t matches = 0;
    for (const auto& file : files) {
        if (matches >= max_matches ||
            (context.cancel_token && context.cancel_token->load())) {
            break;
        }
        const auto size = std::filesystem::file_size(file, ec);
        if (ec || size > kMaxFileBytes || is_probably_binary(file)) {
            continue;
        }
        std::ifstream in(file);
        if (!in.is_open()) {
            continue;
        }

        const std::string display =
            core::errors::is_error(root)
                ? file.string()
                : std::filesystem::relative(file, core::errors::get_value(root), ec).string();
        std::string line;
        std::size_t line_no = 0;
        while (std::getline(in, line)) {
            ++line_no;
            if (line.find(pattern) == std::string::npos) {
                continue;
            }
            out << display << ":" << line_no << ":" << trim_line(line) << "\n";
            if (++matches >= max_matches) {
                break;
            }
        }
    }

    ToolResult result;
    result.success = true;
    result.output = matches == 0 ? "No matches found." : exec::decode_utf8_lossy(out.str());
    result.duration_ms = elapsed_ms_since(started);
    return result;
}

// ---- write_file -----------------------------------------------------------

WriteFileTool::WriteFileTool(policy::WorkspaceGuard guard) : guard_(std::move(guard)) {}

std::string WriteFileTool::description() const {
    return "Create or overwrite a file in the workspace with the given content.";
}

std::string WriteFileTool::parameters_schema() const {
    return R"({"type":"object","properties":{"path":{"type":"string"},)"
           R"("content":{"type":"string"},"overwrite":{"type":"boolean"}},)"
           R"("required":["path","content"]})";
}

core::errors::Status WriteFileTool::validate(const std::string& arguments_json) const {
    return require_keys(name(), arguments_json, {"path", "content"});
}

core::errors::Result<ToolResult> WriteFileTool::execute(const std::string& arguments_json,
                                                        const ToolContext& context) {
    static_cast<void>(context);
    const auto started = std::chrono::steady_clock::now();
    auto valid = validate(arguments_json);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    const json args = json::parse(arguments_json);
    auto resolved = guard_.resolve(args.at("path").get<std::string>());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);
    const std::string content = args.at("content").get<std::string>();
    const bool overwrite = bool_or(args, "overwrite", true);

    std::error_code ec;
    const bool existed = std::filesystem::exists(file_path, ec);
    if (existed && !overwrite) {
        return failure("File exists and overwrite is false: " + file_path.string());
    }
    if (existed && std::filesystem::is_directory(file_path, ec)) {
        return failure("Path is a directory: " + file_path.string());
    }
    std::filesystem::create_directories(file_path.parent_path(), ec);
    if (ec) {
        return failure("Unable to create parent directory: " +
                       file_path.parent_path().string());
    }

    std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return failure("Failed to open file for writing: " + file_path.string());
    }
    out << content;
    if (!out.good()) {
        return failure("I/O error while writing file: " + file_path.string());
    }

    ToolResult result;
    result.success = true;
    result.output = std::string(existed ? "Overwrote " : "Created ") + file_path.string() +
                    " (" + std::to_string(content.size()) + " bytes)";
    result.duration_ms = elapsed_ms_since(started);
    return result;
}

// ---- delete_file ----------------------------------------------------------

DeleteFileTool::DeleteFileTool(policy::WorkspaceGuard guard) : guard_(std::move(guard)) {}

std::string DeleteFileTool::description() const {
    return "Delete a single regular file from the workspace.";
}

std::string DeleteFileTool::parameters_schema() const {
    return R"({"type":"object","properties":{"path":{"type":"string"}},"required":["path"]})";
}

core::errors::Status DeleteFileTool::validate(const std::string& arguments_json) const {
    return require_keys(name(), arguments_json, {"path"});
}

core::errors::Result<ToolResult> DeleteFileTool::execute(const std::string& arguments_json,
                                                         const ToolContext& context) {
    static_cast<void>(context);
    const auto started = std::chrono::steady_clock::now();
    auto valid = validate(arguments_json);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    const json args = json::parse(arguments_json);
    auto resolved = guard_.resolve(args.at("path").get<std::string>());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return failure("Not a regular file: " + file_path.string());
    }
    if (!std::filesystem::remove(file_path, ec) || ec) {
        return failure("Failed to delete file: " + file_path.string());
    }

    ToolResult result;
    result.success = true;
    result.output = "Deleted " + file_path.string();
    result.duration_ms = elapsed_ms_since(started);
    return result;
}

core::errors::Status register_builtin_tools(
    ToolRegistry& registry, const core::config::RuntimeConfig& config,
    std::shared_ptr<exec::SecureCommandExecutor> executor) {
    const policy::WorkspaceGuard guard(config.workdir);

    std::vector<std::unique_ptr<Tool>> tools;
    tools.push_back(std::make_unique<BashTool>(
        std::move(executor), policy::CommandPermissionClassifier(config.bash)));
    tools.push_back(std::make_unique<ReadFileTool>(guard));
    tools.push_back(std::make_unique<GrepTool>(guard));
    tools.push_back(std::make_unique<WriteFileTool>(guard));
    tools.push_back(std::make_unique<DeleteFileTool>(guard));

    for (auto& tool : tools) {
        auto status = registry.register_tool(std::move(tool));
        if (core::errors::is_error(status)) {
            return status;
        }
    }
    for (const auto& entry : config.tool_permissions) {
        registry.set_default_permission(entry.first, entry.second);
    }
    return core::errors::ok();
}

}  // namespace sous::tools
