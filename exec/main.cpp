#include <pcimport/pcimport.hpp>

#include <exception>
#include <iostream>

#include "exec/args_parser.hpp"

int Import(const std::unordered_map<std::string, std::string>& arguments) {
    pcimport::ImportConfig config = pcimport::ImportConfig::FromArguments(arguments);
    pcimport::CooperativeScheduler scheduler;
    auto cloud = pcimport::Importer::Import(config, scheduler);
    return cloud->Size() > 0 ? 0 : 1;
}

int Bench(const std::unordered_map<std::string, std::string>& arguments) {
    pcimport::ImportConfig config = pcimport::ImportConfig::FromArguments(arguments);
    pcimport::CooperativeScheduler scheduler;
    return pcimport::Importer::Bench(config, scheduler) ? 0 : 1;
}

struct EnumClassHash {
    template <typename T>
    std::size_t operator()(T t) const {
        return static_cast<std::size_t>(t);
    }
};

std::unordered_map<ArgsParser::CommandT, int (*)(const std::unordered_map<std::string, std::string>&), EnumClassHash>
    selector;

int main(int argc, char** argv) {
    selector = {{ArgsParser::CommandT::kImport, &Import}, {ArgsParser::CommandT::kBench, &Bench}};

    auto parser = ArgsParser();
    auto command = parser.Parse(argc, argv);
    auto arguments = parser.Arguments();
    try {
        return selector[command](arguments);
    } catch (const std::exception& e) {
        std::cerr << "pcimport: error: " << e.what() << std::endl;
        return 1;
    }
}
