#include "ast/resourceReader.hpp"
#include "compiler/resourceCompiler.hpp"
#include "runtime/errors.hpp"

#include <iostream>
#include <string>
#include <vector>

void printUsage(const char *program) {
    std::cerr << "Usage: " << program << " <resource.json> [options]\n";
    std::cerr << "\nOptions:\n";
    std::cerr << "  --data <file>          Caller data (JSON object of variables)\n";
    std::cerr << "  --globals <file>       Global variables (JSON object)\n";
    std::cerr << "  --entity <id>          Resolve only this entity\n";
    std::cerr << "  --reject-duplicates    Treat repeated ids as errors\n";
    std::cerr << "  --debug                Enable debug logging\n";
}

static bool debugMode = false;

static void log(const std::string &message) {
    if (debugMode) {
        std::cerr << "[l20nc] " << message << std::endl;
    }
}

int main(int argc, char *argv[]) {
    if (argc < 2) {
        printUsage(argv[0]);
        return 1;
    }

    l20n::CompilerOptions options;
    std::string resourceFile;
    std::string dataFile;
    std::string globalsFile;
    std::string entityId;

    for (int argIndex = 1; argIndex < argc; argIndex++) {
        std::string arg = argv[argIndex];
        if ((arg == "--data" || arg == "--globals" || arg == "--entity") && argIndex + 1 >= argc) {
            std::cerr << "Error: " << arg << " needs a value\n";
            return 1;
        }
        if (arg == "--data") {
            dataFile = argv[++argIndex];
        } else if (arg == "--globals") {
            globalsFile = argv[++argIndex];
        } else if (arg == "--entity") {
            entityId = argv[++argIndex];
        } else if (arg == "--reject-duplicates") {
            options.rejectDuplicateIds = true;
        } else if (arg == "--debug") {
            options.debug = true;
            debugMode = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else {
            resourceFile = arg;
        }
    }

    if (resourceFile.empty()) {
        std::cerr << "Error: No resource file specified\n";
        return 1;
    }

    try {
        log("Reading " + resourceFile);
        l20n::Json document = l20n::readResourceFile(resourceFile);

        l20n::Resource resource;
        l20n::ResourceCompiler compiler(options);
        bool compiled = compiler.compile(document, resource);
        compiler.printDiagnostics();
        if (!compiled) {
            return 1;
        }

        l20n::Context context(&resource);
        if (!globalsFile.empty()) {
            log("Reading globals from " + globalsFile);
            context.globals = l20n::scopeFromJson(l20n::readResourceFile(globalsFile));
        }
        l20n::Scope data;
        if (!dataFile.empty()) {
            log("Reading data from " + dataFile);
            data = l20n::scopeFromJson(l20n::readResourceFile(dataFile));
        }

        std::vector<std::string> ids;
        if (!entityId.empty()) {
            if (!resource.entity(entityId)) {
                std::cerr << "Error: No entity named " << entityId << "\n";
                return 1;
            }
            ids.push_back(entityId);
        } else {
            for (const auto &id : resource.ids()) {
                const l20n::Entity *entity = resource.entity(id);
                // local entities are helpers for other entries
                if (entity && !entity->isLocal()) {
                    ids.push_back(id);
                }
            }
        }

        int status = 0;
        l20n::Json output = l20n::Json::object();
        for (const auto &id : ids) {
            log("Resolving " + id);
            try {
                output[id] = resource.entity(id)->getEntity(context, data);
            } catch (const l20n::Error &e) {
                std::cerr << "Error in " << id << ": " << e.what() << "\n";
                status = 1;
            }
        }

        std::cout << output.dump(2) << std::endl;
        return status;

    } catch (const std::exception &e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
