#include "scanner.hpp"
#include "utils/config_loader.hpp"
#include "utils/file_reader.hpp"
#include "utils/printer.hpp"
#include "logger.hpp"
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

struct Config {
    std::vector<std::string> types = {CATEGORY_ALL_TAG};
    std::string configFile;
    std::string jsonFile;
    std::string textFile;
    bool verbose = false;
    bool list = false;
    bool mask = true;
    long jobs = -1;
    long window = -1;
    double minConfidence = -1.0;
    std::vector<std::string> inputs;
};


class ArgParser {
public:
    struct OptionInfo {
        bool takesValue;
        std::string canonicalName;
    };

    std::unordered_map<std::string, OptionInfo> optionDefs;
    std::unordered_map<std::string, std::string> parsedOptions;
    std::vector<std::string> positional;

    void addOption(const std::string& name, bool takesValue, const std::string& canonical) {
        optionDefs[name] = {takesValue, canonical};
    }

    void parse(int argc, char* argv[]) {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (optionDefs.count(arg)) {
                const auto& info = optionDefs[arg];

                if (info.takesValue) {
                    if (i + 1 >= argc) {
                        throw std::runtime_error("Missing value for option: " + arg);
                    }
                    parsedOptions[info.canonicalName] = argv[++i];
                } else {
                    parsedOptions[info.canonicalName] = "true";
                }
            }
            else if (arg.size() > 1 && arg[0] == '-') {
                throw std::runtime_error("Unknown option: " + arg);
            }
            else {
                positional.push_back(arg);
            }
        }
    }

    bool has(const std::string& canonical) const {
        return parsedOptions.count(canonical);
    }

    std::string get(const std::string& canonical, const std::string& def = "") const {
        auto it = parsedOptions.find(canonical);
        return it != parsedOptions.end() ? it->second : def;
    }
};

static std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (!item.empty())
            out.push_back(item);
    }
    return out;
}

static void printUsage() {
    std::cout << "Usage: piidig [options] <text_file|directory>...\n"
              << "  -t LIST    Categories to detect, comma separated, or 'all' (default)\n"
              << "  -j N       Sources scanned in parallel (default 4)\n"
              << "  -w N       Context window in characters (default 20)\n"
              << "  -c F       Minimum confidence to report, 0-1 (default 0.5)\n"
              << "  -C file    JSON configuration file\n"
              << "  -O file    Write JSON report to file\n"
              << "  -o file    Write text report to file\n"
              << "  --no-mask  Show passwords in clear\n"
              << "  -l         List categories\n"
              << "  -d         Enable Debug mode\n"
              << "  -v         Verbose output (context of each finding)\n"
              << "  -h         Show this help message\n";
}

Config parseArgs(int argc, char* argv[]) {

    Config config;
    ArgParser args;
    args.addOption("-h", false, "help");
    args.addOption("--help", false, "help");

    args.addOption("-d", false, "debug");
    args.addOption("--debug", false, "debug");

    args.addOption("-v", false, "verbose");
    args.addOption("--verbose", false, "verbose");

    args.addOption("-l", false, "list");
    args.addOption("--list", false, "list");

    args.addOption("--no-mask", false, "nomask");

    args.addOption("-t", true, "types");
    args.addOption("--types", true, "types");

    args.addOption("-j", true, "jobs");
    args.addOption("--jobs", true, "jobs");

    args.addOption("-w", true, "window");
    args.addOption("--window", true, "window");

    args.addOption("-c", true, "minConfidence");
    args.addOption("--min-confidence", true, "minConfidence");

    args.addOption("-C", true, "config");
    args.addOption("--config", true, "config");

    args.addOption("-O", true, "jsonPath");
    args.addOption("--json", true, "jsonPath");

    args.addOption("-o", true, "textPath");
    args.addOption("--output", true, "textPath");

    args.parse(argc, argv);

    if (args.has("debug"))
    {
        Logger::info("Enabling Debug Mode");
        Logger::setLevel(LogLevel::DEBUG);
    }

    if (args.has("help"))
    {
        printUsage();
        std::exit(0);
    }

    config.verbose = args.has("verbose");
    config.list = args.has("list");
    config.mask = !args.has("nomask");

    if (args.has("types"))
    {
        config.types = splitList(args.get("types"));
        Logger::debug("Categories: " + args.get("types"));
    }

    if (args.has("jobs"))
    {
        config.jobs = std::stol(args.get("jobs"));
        if (config.jobs < 1)
            config.jobs = 1;
        Logger::debug("Setting jobs to " + std::to_string(config.jobs));
    }

    if (args.has("window"))
    {
        config.window = std::stol(args.get("window"));
        if (config.window < 0)
            throw std::runtime_error("Context window must not be negative");
    }

    if (args.has("minConfidence"))
    {
        config.minConfidence = std::stod(args.get("minConfidence"));
        if (config.minConfidence < 0.0 || config.minConfidence > 1.0)
            throw std::runtime_error("Minimum confidence must be within [0, 1]");
    }

    config.configFile = args.get("config");
    config.jsonFile = args.get("jsonPath");
    config.textFile = args.get("textPath");
    config.inputs = args.positional;

    if (config.inputs.empty() && !config.list)
    {
        printUsage();
        std::exit(0);
    }

    return config;
}

static DetectorConfig buildDetectorConfig(const Config& config) {
    DetectorConfig detector;
    if (!config.configFile.empty())
        detector = loadDetectorConfig(config.configFile);
    if (config.jobs > 0)
        detector.maxWorkers = static_cast<size_t>(config.jobs);
    if (config.window >= 0)
        detector.contextWindow = static_cast<size_t>(config.window);
    if (config.minConfidence >= 0.0)
        detector.minConfidence = config.minConfidence;
    if (!config.mask)
        detector.maskPasswords = false;
    return detector;
}

static void listCategoryTable() {
    for (const auto& info : listCategories()) {
        std::cout << ansi::yellow << info.tag << ansi::reset << "\t" << info.displayName
                  << "\t" << info.description << "\n";
    }
}

int main(int argc, char* argv[]) {
    Logger::setLevel(LogLevel::INFO);
    Logger::info("piidig v0.1");

    try {
        Config config = parseArgs(argc, argv);
        if (config.list) {
            listCategoryTable();
            if (config.inputs.empty())
                return 0;
        }

        std::set<Category> categories = parseCategories(config.types);
        Scanner scanner(buildDetectorConfig(config));

        std::vector<std::string> files = collectSourceFiles(config.inputs);
        if (files.empty()) {
            Logger::error("No text files to scan");
            return 1;
        }
        Logger::info("Scanning " + std::to_string(files.size()) + " sources...");

        auto start = std::chrono::high_resolution_clock::now();
        TextFileReader reader;
        BatchReport batch = scanner.scan(files, reader, categories);
        printBatchReport(batch, config.verbose);

        if (!config.jsonFile.empty())
            dumpJson(batch, config.jsonFile);

        if (!config.textFile.empty()) {
            std::ofstream out(config.textFile, std::ios::binary);
            if (!out)
                throw std::runtime_error("Cannot open " + config.textFile + " for writing");
            out << formatBatchReport(batch, true);
            Logger::info("Report written to " + config.textFile);
        }

        auto end = std::chrono::high_resolution_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
        Logger::info("Total elapsed time: " + std::to_string(elapsed) + "ms");
    } catch (const UnknownCategory& e) {
        Logger::error(std::string(e.what()) + " (use -l to list categories)");
        return 2;
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }

    return 0;
}
