#include "generator.hpp"
#include "utils/model_weights.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0
              << " (<path_to_weights_dir> | --random [seed]) [--config file.json] [--max-len N] [--no-cache]\n";
}

struct Options {
    std::string weights_dir;
    std::string config_path;
    bool random = false;
    InitConfig init;
    int max_len = 0;
    bool use_cache = true;
};

Options parse_args(int argc, char** argv) {
    Options options;
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--random") {
            options.random = true;
            if (i + 1 < argc && std::string(argv[i + 1]).rfind("--", 0) != 0) {
                options.init.seed = parse_seed(argv[++i]);
            }
        } else if (arg == "--config") {
            if (i + 1 >= argc) throw std::runtime_error("--config needs a file");
            options.config_path = argv[++i];
        } else if (arg == "--max-len") {
            if (i + 1 >= argc) throw std::runtime_error("--max-len needs a value");
            options.max_len = std::stoi(argv[++i]);
        } else if (arg == "--no-cache") {
            options.use_cache = false;
        } else if (options.weights_dir.empty() && arg.rfind("--", 0) != 0) {
            options.weights_dir = arg;
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    if (options.random == !options.weights_dir.empty()) {
        throw std::runtime_error("Pass either a weights directory or --random");
    }
    return options;
}

std::vector<int> parse_tokens(const std::string& line) {
    std::istringstream iss(line);
    std::vector<int> tokens;
    std::string word;
    while (iss >> word) {
        size_t used = 0;
        const int id = std::stoi(word, &used);
        if (used != word.size()) throw std::runtime_error("Not a token id: " + word);
        tokens.push_back(id);
    }
    return tokens;
}

void print_tokens(const std::vector<int>& tokens) {
    std::cout << "[";
    for (size_t i = 0; i < tokens.size(); ++i) {
        std::cout << tokens[i];
        if (i < tokens.size() - 1) {
            std::cout << ", ";
        }
    }
    std::cout << "]\n";
}

}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    try {
        const Options options = parse_args(argc, argv);

        // Defaults unless a config file overrides them
        const GeneratorConfig config = options.config_path.empty()
            ? GeneratorConfig{}
            : load_config(options.config_path);
        std::cout << "Initializing generator with config:\n" << describe(config) << "\n";

        auto start_time = std::chrono::high_resolution_clock::now();
        ModelWeights weights(config);
        if (options.random) {
            std::cout << "Initializing random weights with seed " << options.init.seed << std::endl;
            weights.init_data_random(options.init);
        } else {
            std::cout << "Loading weights from: " << options.weights_dir << std::endl;
            weights.load_weights(options.weights_dir);
        }
        auto end_time = std::chrono::high_resolution_clock::now();
        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);
        std::cout << "Weights ready in " << duration.count() << "ms\n";

        Generator generator(weights);

        std::cout << "--- Inference Process Started! ---\n";
        std::cout << "[ Enter source token ids separated by spaces, \"quit\" to stop ]\n";

        std::string line;
        while (true) {
            std::cout << "\nUser Input Sequence >> " << std::flush;
            if (!std::getline(std::cin, line) || line == "quit") break;

            // A bad line is reported and the loop carries on.
            try {
                const std::vector<int> src = parse_tokens(line);
                if (src.empty()) continue;

                start_time = std::chrono::high_resolution_clock::now();
                const TokenBatch out = options.use_cache
                    ? generator.generate({src}, options.max_len)
                    : generator.generate_without_cache({src}, options.max_len);
                end_time = std::chrono::high_resolution_clock::now();
                duration = std::chrono::duration_cast<std::chrono::milliseconds>(end_time - start_time);

                std::cout << "Model Out Sequence >> ";
                print_tokens(out.front());
                std::cout << "Inference done in " << duration.count() << "ms\n";
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << std::endl;
            }
        }

        std::cout << "\n--- Inference Process has terminated! ---\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
