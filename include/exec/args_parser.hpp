#ifndef ARGS_PARSER_HPP
#define ARGS_PARSER_HPP

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <string>
#include <unordered_map>
#include <unordered_set>

class ArgsParser {
   public:
    enum CommandT {
        kNone,
        kImport,
        kBench,
    };

    const std::string arg_file_ = "file";
    const std::string arg_chunk_capacity_ = "chunk_capacity";
    const std::string arg_yield_interval_ = "yield_interval";
    const std::string arg_import_step_ = "import_step";
    const std::string arg_batch_size_ = "batch_size";
    const std::string arg_points_ = "points";
    const std::string arg_verbose_ = "verbose";

   private:
    std::unordered_map<std::string, CommandT> position_ = {{"-h", CommandT::kNone},
                                                           {"--help", CommandT::kNone},
                                                           {"import", CommandT::kImport},
                                                           {"bench", CommandT::kBench}};

    std::unordered_map<std::string, void (ArgsParser::*)(const std::unordered_map<std::string, std::string>&)>
        selector_ = {{"import", &ArgsParser::Import}, {"bench", &ArgsParser::Bench}};

    // flags that take no value
    std::unordered_set<std::string> switches_ = {"-h", "--help", "-v", "--verbose"};

    const std::string help_info_ =
        "Usage: pcimport [COMMAND] [OPTIONS]\n"
        "\n"
        "Commands:\n"
        "  import     Import a PLY point cloud into chunked storage.\n"
        "  bench      Stress the chunked storage with synthetic points.\n"
        "\n"
        "Options:\n"
        "  -h, --help  Show this help message and exit.\n"
        "\n"
        "Commands:\n"
        "\n"
        "  import\n"
        "    Import a PLY point cloud (ascii or binary_little_endian).\n"
        "\n"
        "    Usage: pcimport import [OPTIONS]\n"
        "\n"
        "    Options:\n"
        "      -f, --file <FILE>               Specify the PLY file to import.\n"
        "      -c, --chunk-capacity <COUNT>    Elements per chunk (default 100000).\n"
        "      -y, --yield-interval <COUNT>    Elements between cooperative yields (default 50000).\n"
        "      -s, --step <COUNT>              Keep every COUNT-th vertex (default 1).\n"
        "      -b, --batch-size <COUNT>        Vertices per parser batch (default 100000).\n"
        "      -v, --verbose                   Print read progress.\n"
        "\n"
        "  bench\n"
        "    Fill chunked storage through the bulk and incremental paths and scan it.\n"
        "\n"
        "    Usage: pcimport bench [OPTIONS]\n"
        "\n"
        "    Options:\n"
        "      -n, --points <COUNT>            Number of synthetic points (default 1000000).\n"
        "      -c, --chunk-capacity <COUNT>    Elements per chunk (default 100000).\n"
        "      -y, --yield-interval <COUNT>    Elements between cooperative yields (default 50000).\n"
        "      -b, --batch-size <COUNT>        Points per bulk batch (default 100000).\n";

    std::unordered_map<std::string, std::string> arguments_;

   private:
    void Import(const std::unordered_map<std::string, std::string>& args);

    void Bench(const std::unordered_map<std::string, std::string>& args);

    void Common(const std::unordered_map<std::string, std::string>& args);

    inline bool IsNumber(const std::string& s) {
        return !s.empty() &&
               std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)); });
    }

   public:
    CommandT Parse(int argc, char** argv);

    const std::unordered_map<std::string, std::string>& Arguments() const;
};

#endif  // ARGS_PARSER_HPP
