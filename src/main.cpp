/*
 * boxrun - Sandboxed Code Execution
 * Runs inline code or project directories in throwaway containers and
 * keeps the files they produce addressable as artifacts://<id>/<name>
 */

#include "artifact_store.h"
#include "config.h"
#include "constants.h"
#include "docker_backend.h"
#include "errors.h"
#include "file_utils.h"
#include "orchestrator.h"
#include "runtime_profile.h"
#include <json/json.h>
#include <iostream>
#include <iterator>
#include <map>
#include <memory>
#include <string>
#include <vector>

using namespace boxrun;

namespace {

void print_usage() {
    std::cerr
        << "Usage: boxrun [--config FILE] <command> [args]\n"
        << "\n"
        << "Commands:\n"
        << "  run <language> [--file PATH] [--entrypoint CMD] [--output-dir DIR]\n"
        << "                 [--progress-token TOKEN] [--rm]   Run code (stdin if no --file)\n"
        << "  project <language> <dir> [--entrypoint CMD] [--output-dir DIR]\n"
        << "                 [--progress-token TOKEN] [--rm]   Run a project directory\n"
        << "  fetch <uri> [--out PATH]                         Fetch an artifact\n"
        << "  list [prefix]                                    List artifacts\n"
        << "  logs <id|containers://id/logs>                   Logs of an execution\n"
        << "  purge <id>                                       Delete artifacts of an execution\n"
        << "  languages                                        Supported languages\n";
}

std::string to_json(const Json::Value& value, bool compact = false) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = compact ? "" : "  ";
    return Json::writeString(builder, value);
}

// One JSON object per line on stderr
class StderrProgressObserver : public ProgressObserver {
public:
    bool on_progress(const ProgressUpdate& update) override {
        Json::Value event;
        event["progressToken"] = update.token;
        event["progress"] = update.progress;
        event["total"] = update.total;
        std::cerr << to_json(event, true) << std::endl;
        return static_cast<bool>(std::cerr);
    }
};

Json::Value record_to_json(const ArtifactRecord& record) {
    Json::Value item;
    item["uri"] = record.uri();
    item["executionId"] = record.execution_id;
    item["name"] = record.file_name;
    item["category"] = record.category;
    item["mimeType"] = FileUtils::get_mime_type(record.file_name);
    item["size"] = static_cast<Json::UInt64>(record.size_bytes);
    item["sha256"] = record.sha256;
    return item;
}

// Positional arguments and --flags of one command
struct Arguments {
    std::vector<std::string> positional;
    std::map<std::string, std::string> options;
    bool remove_after = false;
};

Arguments parse_arguments(int argc, char* argv[], int first) {
    Arguments args;
    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--rm") {
            args.remove_after = true;
        } else if (arg.compare(0, 2, "--") == 0) {
            if (i + 1 >= argc) {
                throw SandboxError(ErrorKind::CONFIG_INVALID, "missing value for " + arg);
            }
            args.options[arg.substr(2)] = argv[++i];
        } else {
            args.positional.push_back(arg);
        }
    }
    return args;
}

std::string option(const Arguments& args, const std::string& name) {
    auto it = args.options.find(name);
    return it == args.options.end() ? "" : it->second;
}

int command_run(Orchestrator& orchestrator, const Arguments& args, bool project) {
    size_t expected = project ? 2 : 1;
    if (args.positional.size() != expected) {
        print_usage();
        return 2;
    }

    ExecutionRequest request;
    request.language = args.positional[0];
    request.entrypoint = option(args, "entrypoint");
    request.output_dir = option(args, "output-dir");

    if (project) {
        request.project_dir = args.positional[1];
    } else {
        std::string file = option(args, "file");
        if (!file.empty()) {
            if (!FileUtils::read_file(file, request.code)) {
                throw SandboxError(ErrorKind::CONFIG_INVALID, "cannot read " + file);
            }
        } else {
            request.code.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
        }
    }

    std::string token = option(args, "progress-token");
    StderrProgressObserver observer;
    RunResult result = orchestrator.run(request, token.empty() ? nullptr : &observer, token);

    Json::Value output;
    output["executionId"] = result.execution_id;
    output["exitCode"] = result.exit_code;
    output["logs"] = result.logs;
    output["logsUri"] = std::string(LOGS_URI_SCHEME) + result.execution_id + "/logs";
    output["artifacts"] = Json::Value(Json::arrayValue);
    for (const auto& uri : result.artifacts) {
        output["artifacts"].append(uri);
    }
    std::cout << to_json(output) << std::endl;

    if (args.remove_after) {
        orchestrator.discard(result.execution_id);
    }
    return 0;
}

int command_fetch(Orchestrator& orchestrator, const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return 2;
    }

    ArtifactContent content = orchestrator.fetch_artifact(args.positional[0]);
    std::string out = option(args, "out");

    Json::Value output;
    output["uri"] = content.uri;
    output["name"] = content.file_name;
    output["category"] = content.category;
    output["mimeType"] = content.mime_type;
    output["size"] = static_cast<Json::UInt64>(content.data.size());
    if (out.empty()) {
        output["data"] = FileUtils::base64_encode(content.data);
    } else {
        if (!FileUtils::write_file(out, content.data)) {
            std::cerr << "Failed to write " << out << std::endl;
            return 1;
        }
        output["path"] = out;
    }
    std::cout << to_json(output) << std::endl;
    return 0;
}

int command_list(Orchestrator& orchestrator, const Arguments& args) {
    std::string prefix = args.positional.empty() ? ARTIFACT_URI_SCHEME : args.positional[0];

    Json::Value output(Json::arrayValue);
    for (const auto& record : orchestrator.list_artifacts(prefix)) {
        output.append(record_to_json(record));
    }
    std::cout << to_json(output) << std::endl;
    return 0;
}

int command_logs(Orchestrator& orchestrator, const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return 2;
    }
    std::cout << orchestrator.execution_logs(args.positional[0]);
    return 0;
}

int command_purge(ArtifactStore& store, const Arguments& args) {
    if (args.positional.size() != 1) {
        print_usage();
        return 2;
    }
    Json::Value output;
    output["executionId"] = args.positional[0];
    output["removed"] = static_cast<Json::UInt64>(store.purge(args.positional[0]));
    std::cout << to_json(output) << std::endl;
    return 0;
}

int command_languages() {
    Json::Value output(Json::arrayValue);
    for (const auto& language : supported_languages()) {
        RuntimeProfile profile = lookup_profile(language);
        Json::Value item;
        item["language"] = profile.language;
        item["image"] = profile.image;
        item["extension"] = profile.extension;
        output.append(item);
    }
    std::cout << to_json(output) << std::endl;
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string config_file;
    int first = 1;
    if (argc > 2 && std::string(argv[1]) == "--config") {
        config_file = argv[2];
        first = 3;
    }
    if (first >= argc) {
        print_usage();
        return 2;
    }
    std::string command = argv[first];

    try {
        if (command == "languages") {
            return command_languages();
        }

        Arguments args = parse_arguments(argc, argv, first + 1);
        Config config = Config::load(config_file);

        ArtifactStore store(config.artifact_store_root);
        if (config.restore_index) {
            store.rebuild_index();
        }
        if (command == "purge") {
            return command_purge(store, args);
        }

        DockerBackend backend(config.docker_binary);
        Orchestrator orchestrator(config, backend, store);

        if (command == "run") {
            return command_run(orchestrator, args, false);
        } else if (command == "project") {
            return command_run(orchestrator, args, true);
        } else if (command == "fetch") {
            return command_fetch(orchestrator, args);
        } else if (command == "list") {
            return command_list(orchestrator, args);
        } else if (command == "logs") {
            return command_logs(orchestrator, args);
        }

        std::cerr << "Unknown command: " << command << std::endl;
        print_usage();
        return 2;
    } catch (const SandboxError& e) {
        Json::Value error;
        error["error"] = error_kind_to_string(e.kind());
        error["message"] = e.message();
        if (!e.logs().empty()) {
            error["logs"] = e.logs();
        }
        std::cout << to_json(error) << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
