#include "splitsheet/core/ConfigStore.hpp"
#include "splitsheet/core/Exception.hpp"
#include "splitsheet/core/ProcessConfig.hpp"
#include "splitsheet/core/SplitProcessor.hpp"
#include "splitsheet/utils/Logger.hpp"

#include <fmt/format.h>
#include <getopt.h>

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

// 仅有长选项的编号
enum LongOnlyOption {
    kOptNoImages = 1000,
    kOptSaveConfig
};

struct CommandLine {
    std::string input;
    std::string process_type = splitsheet::core::toString(splitsheet::core::ProcessType::SeaRailWithImage);
    std::optional<int> weight_column;
    std::optional<int> box_column;
    bool no_images = false;
    std::string config_file;
    bool save_config = false;
    std::string log_file;
    bool verbose = false;
};

void printUsage(const char* program) {
    fmt::print("Usage: {} [OPTION] FILE\n", program);
    fmt::print("\n");
    fmt::print("Splits merged weight rows of a packing list into a new workbook (FILE_拆分表.xlsx).\n");
    fmt::print("\n");
    fmt::print("Options:\n");
    fmt::print("\t-t, --type TYPE          process type: sea-rail-with-image (default),\n");
    fmt::print("\t                         sea-rail-no-image, air-freight\n");
    fmt::print("\t-w, --weight-column N    weight column (1-based)\n");
    fmt::print("\t-b, --box-column N       box column (1-based)\n");
    fmt::print("\t    --no-images          do not copy images\n");
    fmt::print("\t-c, --config FILE        config file (default: $XDG_CONFIG_HOME/splitsheet/excel_configs.json)\n");
    fmt::print("\t    --save-config        store the effective config for TYPE\n");
    fmt::print("\t-l, --log-file FILE      write the log to FILE\n");
    fmt::print("\t-v, --verbose            debug logging on the console\n");
    fmt::print("\t-h, --help               show this help message\n");
}

std::optional<int> parseColumn(const char* text) {
    char* end = nullptr;
    long value = std::strtol(text, &end, 10);
    if (!text[0] || *end != '\0' || value < 1 || value > 16384) {
        return std::nullopt;
    }
    return static_cast<int>(value);
}

// 0 表示继续，其他值为退出码
int parseCommandLine(int argc, char* argv[], CommandLine& cmd) {
    static const struct option long_options[] = {
        {"type",          required_argument, nullptr, 't'},
        {"weight-column", required_argument, nullptr, 'w'},
        {"box-column",    required_argument, nullptr, 'b'},
        {"no-images",     no_argument,       nullptr, kOptNoImages},
        {"config",        required_argument, nullptr, 'c'},
        {"save-config",   no_argument,       nullptr, kOptSaveConfig},
        {"log-file",      required_argument, nullptr, 'l'},
        {"verbose",       no_argument,       nullptr, 'v'},
        {"help",          no_argument,       nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int ch;
    while ((ch = getopt_long(argc, argv, "t:w:b:c:l:vh", long_options, nullptr)) != -1) {
        switch (ch) {
            case 't':
                cmd.process_type = optarg;
                break;
            case 'w':
                cmd.weight_column = parseColumn(optarg);
                if (!cmd.weight_column) {
                    fmt::print(stderr, "ERROR: invalid weight column '{}'\n", optarg);
                    return kExitUsage;
                }
                break;
            case 'b':
                cmd.box_column = parseColumn(optarg);
                if (!cmd.box_column) {
                    fmt::print(stderr, "ERROR: invalid box column '{}'\n", optarg);
                    return kExitUsage;
                }
                break;
            case kOptNoImages:
                cmd.no_images = true;
                break;
            case 'c':
                cmd.config_file = optarg;
                break;
            case kOptSaveConfig:
                cmd.save_config = true;
                break;
            case 'l':
                cmd.log_file = optarg;
                break;
            case 'v':
                cmd.verbose = true;
                break;
            case 'h':
                printUsage(argv[0]);
                return -1;
            default:
                printUsage(argv[0]);
                return kExitUsage;
        }
    }

    if (optind != argc - 1) {
        printUsage(argv[0]);
        return kExitUsage;
    }
    cmd.input = argv[optind];
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    using namespace splitsheet;

    CommandLine cmd;
    const int parse_status = parseCommandLine(argc, argv, cmd);
    if (parse_status < 0) {
        return kExitOk;
    }
    if (parse_status != 0) {
        return parse_status;
    }

    Logger::getInstance().initialize(cmd.log_file,
                                     cmd.verbose ? Logger::Level::DEBUG : Logger::Level::WARN,
                                     true);

    int exit_code = kExitOk;
    try {
        if (!core::processTypeFromString(cmd.process_type)) {
            fmt::print(stderr, "ERROR: unknown process type '{}'\n", cmd.process_type);
            Logger::getInstance().shutdown();
            return kExitUsage;
        }

        const core::ConfigStore store = cmd.config_file.empty()
                                            ? core::ConfigStore::openDefault()
                                            : core::ConfigStore(core::Path(cmd.config_file));

        core::ProcessConfig config = store.loadForType(cmd.process_type);
        if (cmd.weight_column) config.weight_column = *cmd.weight_column;
        if (cmd.box_column) config.box_column = *cmd.box_column;
        if (cmd.no_images) config.copy_images = false;
        config.validate();

        if (cmd.save_config) {
            store.saveForType(config);
            fmt::print("配置已保存: {}\n", store.path().string());
        }

        const core::SplitProcessor processor(config);
        const core::ProcessResult result = processor.process(cmd.input);
        for (const auto& line : result.logs) {
            fmt::print("{}\n", line);
        }
        fmt::print("{}: {}\n", result.message, result.output_path);
    } catch (const core::ValidationException& e) {
        fmt::print(stderr, "ERROR [{}]: {}\n", core::toString(e.getCategory()), e.what());
        exit_code = kExitUsage;
    } catch (const core::SplitSheetException& e) {
        SPLITSHEET_LOG_ERROR("Processing failed: {}", e.getDetailedMessage());
        fmt::print(stderr, "ERROR [{}]: {}\n", core::toString(e.getCategory()), e.what());
        exit_code = kExitFailure;
    } catch (const std::exception& e) {
        SPLITSHEET_LOG_ERROR("Unexpected error: {}", e.what());
        fmt::print(stderr, "ERROR: {}\n", e.what());
        exit_code = kExitFailure;
    }

    Logger::getInstance().shutdown();
    return exit_code;
}
