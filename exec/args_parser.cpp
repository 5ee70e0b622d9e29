#include "exec/args_parser.hpp"

namespace {

struct Option {
    const char* short_flag;
    const char* long_flag;
    const char* key;
};

constexpr Option kNumericOptions[] = {
    {"-c", "--chunk-capacity", "chunk_capacity"}, {"-y", "--yield-interval", "yield_interval"},
    {"-s", "--step", "import_step"},              {"-b", "--batch-size", "batch_size"},
    {"-n", "--points", "points"},
};

}  // namespace

void ArgsParser::Common(const std::unordered_map<std::string, std::string>& args) {
    for (const auto& option : kNumericOptions) {
        std::string value;
        if (args.count(option.short_flag))
            value = args.at(option.short_flag);
        else if (args.count(option.long_flag))
            value = args.at(option.long_flag);
        else
            continue;

        if (!IsNumber(value) || value.find_first_not_of('0') == std::string::npos)
            std::cerr << "pcimport: warning: " << option.long_flag << " " << value
                      << " is not a positive integer, using the default" << std::endl;
        arguments_[option.key] = value;
    }

    if (args.count("-v") || args.count("--verbose"))
        arguments_[arg_verbose_] = "";
}

void ArgsParser::Import(const std::unordered_map<std::string, std::string>& args) {
    if (args.empty() || args.count("-h") || args.count("--help")) {
        std::cout << help_info_ << std::endl;
        exit(1);
    }
    if (!args.count("-f") && !args.count("--file")) {
        std::cerr << "usage: pcimport import [-f FILE]" << std::endl;
        std::cerr << "pcimport: error: the following arguments are required: [-f FILE]" << std::endl;
        exit(1);
    }
    if (args.count("-n") || args.count("--points")) {
        std::cerr << "pcimport: error: argument --points is only valid for bench" << std::endl;
        exit(1);
    }
    arguments_[arg_file_] = args.count("-f") ? args.at("-f") : args.at("--file");
    Common(args);
}

void ArgsParser::Bench(const std::unordered_map<std::string, std::string>& args) {
    if (args.count("-h") || args.count("--help")) {
        std::cout << help_info_ << std::endl;
        exit(1);
    }
    if (args.count("-f") || args.count("--file") || args.count("-s") || args.count("--step")) {
        std::cerr << "pcimport: error: bench takes no input file" << std::endl;
        exit(1);
    }
    Common(args);
}

ArgsParser::CommandT ArgsParser::Parse(int argc, char** argv) {
    if (argc == 1) {
        std::cout << help_info_ << std::endl;
        std::cerr << "error: the following arguments are required: command" << std::endl;
        exit(1);
    }

    std::string argv1 = std::string(argv[1]);

    if (argc == 2 && (argv1 == "-h" || argv1 == "--help")) {
        std::cout << help_info_ << std::endl;
        exit(1);
    }

    if (!position_.count(argv1) || !selector_.count(argv1)) {
        std::cout << help_info_ << std::endl;
        std::cerr << "error: the following arguments are required: command" << std::endl;
        exit(1);
    }

    std::unordered_map<std::string, std::string> args;
    for (int i = 2; i < argc; i++) {
        if (argv[i][0] != '-') {
            std::cerr << "error: unrecognized arguments: " << argv[i] << std::endl;
            exit(1);
        }
        if (switches_.count(argv[i])) {
            args.emplace(argv[i], "");
            continue;
        }
        if (i + 1 >= argc || argv[i + 1][0] == '-') {
            std::cerr << "error: argument " << argv[i] << ": expected one argument" << std::endl;
            exit(1);
        }
        args.emplace(argv[i], argv[i + 1]);
        i++;
    }

    // run the parser of the selected command
    (this->*selector_[argv1])(args);
    return position_[argv1];
}

const std::unordered_map<std::string, std::string>& ArgsParser::Arguments() const {
    return arguments_;
}
