#pragma once

#include <cstdint>
#include <iostream>
#include <string>
#include <vector>
#include <bsoncxx/oid.hpp>
#include "bucket/bucket.hpp"

namespace gridstore {
namespace cli {

// Parses a decimal chunk size, false if malformed or outside the int32 range
bool parse_chunk_size(const std::string& text, std::int32_t& chunk_size);

class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    explicit CLI(bucket::Bucket& bucket, std::istream& input = std::cin, std::ostream& output = std::cout);


    // ---- STARTUP ----
    // Reads commands until "quit" or end of input
    void run();
    // Executes one command line, returns false once the shell should exit
    bool execute(const std::string& line);

private:
    // ---- PARAMETERS ----
    bool running_;
    bucket::Bucket& bucket_;
    std::istream& input_;
    std::ostream& output_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_put_command(const std::string& path);
    void handle_get_command(const std::string& id, const std::string& output_path);
    void handle_cat_command(const std::string& id);
    void handle_list_command(const std::string& filename);
    void handle_remove_command(const std::string& id);
    void handle_rename_command(const std::string& id, const std::string& new_filename);
    void handle_drop_command();
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);

    // Parses a 24 hex character file id, throws bucket::GridStoreError if malformed
    static bsoncxx::oid parse_id(const std::string& id);
};

} // namespace cli
} // namespace gridstore
