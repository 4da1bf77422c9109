#include "cli_parser.hpp"
#include <charconv>
#include <fstream>
#include <sstream>
#include <system_error>
#include <vector>

namespace agentlink::app::cli {

    using namespace agentlink::core::errors;
    using nlohmann::json;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> server;
        std::optional<std::string> method;
        std::optional<std::string> params;
        std::optional<std::string> output;
        std::optional<std::string> timeout;
        std::optional<std::string> retry;
        std::optional<RelayTarget> relay;
        bool verbose = false;
    };

    namespace {

        Result<std::uint32_t> parse_count(const std::string& flag, const std::string& text,
                                          const std::uint32_t min_value) {
            std::uint32_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end || text.empty()) {
                return LinkError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < min_value) {
                return LinkError{ErrorCategory::Input, flag + " must be at least " + std::to_string(min_value), "bounds_error"};
            }
            return value;
        }

    } // namespace

    Result<CallRequest> parse_and_validate(int argc, char* argv[], const core::config::Environment& env) {
        if (argc < 2) {
            return LinkError{ErrorCategory::Input, "No arguments provided.", "missing_command", "Usage: agentlink-call --server CMD --method NAME [--params JSON]"};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 1; i < argc; ++i) {
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        auto take = [&args](size_t& i, std::optional<std::string>& slot) -> bool {
            if (i + 1 >= args.size()) return false;
            slot = args[++i];
            return true;
        };
        for (size_t i = 0; i < args.size(); ++i) {
            const std::string& arg = args[i];
            if (arg == "--server") {
                if (!take(i, raw.server)) return LinkError{ErrorCategory::Input, "Missing value for --server", "missing_value"};
            } else if (arg == "--method") {
                if (!take(i, raw.method)) return LinkError{ErrorCategory::Input, "Missing value for --method", "missing_value"};
            } else if (arg == "--params") {
                if (!take(i, raw.params)) return LinkError{ErrorCategory::Input, "Missing value for --params", "missing_value"};
            } else if (arg == "--output") {
                if (!take(i, raw.output)) return LinkError{ErrorCategory::Input, "Missing value for --output", "missing_value"};
            } else if (arg == "--timeout") {
                if (!take(i, raw.timeout)) return LinkError{ErrorCategory::Input, "Missing value for --timeout", "missing_value"};
            } else if (arg == "--retry") {
                if (!take(i, raw.retry)) return LinkError{ErrorCategory::Input, "Missing value for --retry", "missing_value"};
            } else if (arg == "--relay-screenshot") {
                if (i + 2 >= args.size()) return LinkError{ErrorCategory::Input, "--relay-screenshot needs FROM and TO", "missing_value"};
                RelayTarget relay;
                relay.from = args[++i];
                relay.to = args[++i];
                raw.relay = relay;
            } else if (arg == "--verbose" || arg == "-v") {
                raw.verbose = true;
            } else {
                return LinkError{ErrorCategory::Input, "Unknown argument: " + arg, "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        CallRequest req;
        req.verbose = raw.verbose;

        if (!raw.server.has_value() || raw.server->empty()) {
            return LinkError{ErrorCategory::Input, "Must provide --server", "missing_required_flag"};
        }
        req.server = *raw.server;

        // Mutual Exclusion XOR check
        if (!raw.method.has_value() && !raw.relay.has_value()) {
            return LinkError{ErrorCategory::Input, "Must provide either --method or --relay-screenshot", "missing_required_flag"};
        }
        if (raw.method.has_value() && raw.relay.has_value()) {
            return LinkError{ErrorCategory::Input, "Cannot provide both --method and --relay-screenshot", "conflicting_flags"};
        }
        req.method = raw.method;
        req.relay = raw.relay;

        if (raw.params) {
            auto params = parse_params(*raw.params, env);
            if (is_error(params)) return get_error(params);
            req.params = get_value(params);
        }

        if (raw.output) {
            if (*raw.output == "json") req.output = OutputMode::Json;
            else if (*raw.output == "text") req.output = OutputMode::Text;
            else if (*raw.output == "result") req.output = OutputMode::Result;
            else return LinkError{ErrorCategory::Input, "Invalid --output: " + *raw.output, "invalid_output", "Use json, text or result."};
        }

        if (raw.timeout) {
            auto timeout = parse_count("--timeout", *raw.timeout, 1);
            if (is_error(timeout)) return get_error(timeout);
            req.timeout_seconds = get_value(timeout);
        }
        if (raw.retry) {
            auto retry = parse_count("--retry", *raw.retry, 1);
            if (is_error(retry)) return get_error(retry);
            req.retry = get_value(retry);
        }

        return req;
    }

    std::string expand_env_vars(const std::string& text, const core::config::Environment& env) {
        std::string out;
        out.reserve(text.size());
        size_t i = 0;
        while (i < text.size()) {
            if (text[i] == '$' && i + 1 < text.size() && text[i + 1] == '{') {
                const size_t close = text.find('}', i + 2);
                if (close != std::string::npos && close > i + 2) {
                    const std::string body = text.substr(i + 2, close - i - 2);
                    const size_t colon = body.find(':');
                    const std::string name = body.substr(0, colon);
                    if (!name.empty()) {
                        const std::string fallback = colon == std::string::npos ? "" : body.substr(colon + 1);
                        const auto value = env(name);
                        out += value.has_value() ? *value : fallback;
                        i = close + 1;
                        continue;
                    }
                }
            }
            out.push_back(text[i]);
            ++i;
        }
        return out;
    }

    Result<json> parse_params(const std::string& input, const core::config::Environment& env) {
        if (input.empty()) {
            return json::object();
        }

        std::string source = input;
        if (input.front() == '@') {
            const std::string file_path = input.substr(1);
            std::ifstream file(file_path);
            if (!file.is_open()) {
                return LinkError{ErrorCategory::Input, "Params file not found: " + file_path, "params_file_missing"};
            }
            std::stringstream buffer;
            buffer << file.rdbuf();
            source = buffer.str();
        }

        const std::string expanded = expand_env_vars(source, env);
        json params = json::parse(expanded, nullptr, false);
        if (params.is_discarded()) {
            return LinkError{ErrorCategory::Input, "Failed to parse params: " + expanded, "invalid_params_json"};
        }
        if (params.is_null()) {
            return json::object();
        }
        if (!params.is_object()) {
            return LinkError{ErrorCategory::Input, "Params must be a JSON object", "invalid_params_json"};
        }
        return params;
    }

    Result<std::string> format_response(const OutputMode mode, const json& response) {
        switch (mode) {
            case OutputMode::Json:
                return response.dump(2, ' ', false, json::error_handler_t::replace);
            case OutputMode::Result: {
                if (!response.contains("result")) {
                    return LinkError{ErrorCategory::Protocol, "No result returned", "missing_result"};
                }
                const json& result = response["result"];
                if (result.is_object() || result.is_array()) {
                    return result.dump(2, ' ', false, json::error_handler_t::replace);
                }
                return result.is_string() ? result.get<std::string>() : result.dump();
            }
            case OutputMode::Text:
                if (!response.contains("result")) {
                    return std::string("Done");
                }
                return "Success: " + response["result"].dump(-1, ' ', false, json::error_handler_t::replace);
        }
        return LinkError{ErrorCategory::Internal, "Unhandled output mode", "invalid_output"};
    }

} // namespace agentlink::app::cli
