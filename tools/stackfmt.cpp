#include <iostream>
#include <string_view>
#include <editline/readline.h>
#include <string>
#include <vector>
#include <algorithm>
#include <sstream>
#include <libstackfmt/trace.hpp>
#include <libstackfmt/error.hpp>
#include <libstackfmt/parse.hpp>
#include <fmt/format.h>

namespace {
    std::vector<std::string> split(std::string_view str, char delimiter) {
        std::vector<std::string> out{};
        std::stringstream ss{ std::string{str} };
        std::string item;

        while (std::getline(ss, item, delimiter)) {
            out.push_back(item);
        }

        return out;
    }

    bool is_prefix(std::string_view str, std::string_view of) {
        if (str.size() > of.size()) return false;
        return std::equal(str.begin(), str.end(), of.begin());
    }

    [[gnu::noinline]] std::string innermost(const stackfmt::stack_trace_config& cfg) {
        return stackfmt::new_stack_trace({
            stackfmt::with_skip_frames(cfg.skip_frames),
            stackfmt::with_include_source_code(cfg.include_source_code),
            stackfmt::with_include_pc(cfg.include_pc),
            stackfmt::with_short_func_names(cfg.short_func_names),
            stackfmt::with_show_full_path(cfg.show_full_path),
            stackfmt::with_show_line_numbers(cfg.show_line_numbers),
            stackfmt::with_frame_separator(cfg.frame_separator),
            stackfmt::with_chunk_separator(cfg.chunk_separator),
            stackfmt::with_chunk_indentation(cfg.chunk_indentation) });
    }

    [[gnu::noinline]] std::string middle(const stackfmt::stack_trace_config& cfg) {
        auto trace = innermost(cfg);
        return trace;
    }

    [[gnu::noinline]] std::string outermost(const stackfmt::stack_trace_config& cfg) {
        auto trace = middle(cfg);
        return trace;
    }

    void print_help(const std::vector<std::string>& args) {
        if (args.size() == 1) {
            std::cerr << R"(Available commands:
    trace - Print a stack trace captured inside a nested call chain
    set   - Change a formatting option
    show  - Print the current formatting options
    reset - Restore the default formatting options
)";
        }
        else if (is_prefix(args[1], "set")) {
            std::cerr << R"(Usage: set <option> <value>
Options:
    skip_frames         <integer>
    include_source_code <bool>
    include_pc          <bool>
    short_func_names    <bool>
    show_full_path      <bool>
    show_line_numbers   <bool>
    frame_separator     <text>
    chunk_separator     <text>
    chunk_indentation   <text>
Booleans are true/false, on/off or 1/0. Text accepts \n, \t and \\.
)";
        }
        else {
            std::cerr << "No help available on that\n";
        }
    }

    void print_config(const stackfmt::stack_trace_config& cfg) {
        auto on_off = [](bool b) { return b ? "on" : "off"; };
        fmt::print("skip_frames         {}\n", cfg.skip_frames);
        fmt::print("include_source_code {}\n", on_off(cfg.include_source_code));
        fmt::print("include_pc          {}\n", on_off(cfg.include_pc));
        fmt::print("short_func_names    {}\n", on_off(cfg.short_func_names));
        fmt::print("show_full_path      {}\n", on_off(cfg.show_full_path));
        fmt::print("show_line_numbers   {}\n", on_off(cfg.show_line_numbers));
        fmt::print("frame_separator     \"{}\"\n", stackfmt::escape(cfg.frame_separator));
        fmt::print("chunk_separator     \"{}\"\n", stackfmt::escape(cfg.chunk_separator));
        fmt::print("chunk_indentation   \"{}\"\n", stackfmt::escape(cfg.chunk_indentation));
    }

    bool parse_bool(std::string_view text) {
        auto value = stackfmt::to_bool(text);
        if (!value) stackfmt::error::send("Invalid boolean value");
        return *value;
    }

    void handle_set(stackfmt::stack_trace_config& cfg,
        const std::vector<std::string>& args) {
        if (args.size() < 3) {
            print_help({ "help", "set" });
            return;
        }

        auto& field = args[1];
        std::string value = args[2];
        for (std::size_t i = 3; i < args.size(); ++i) {
            value += ' ' + args[i];
        }

        if (field == "skip_frames") {
            auto skip = stackfmt::to_integral<int>(value);
            if (!skip) stackfmt::error::send("Invalid frame count");
            cfg.skip_frames = *skip;
        }
        else if (field == "include_source_code") {
            cfg.include_source_code = parse_bool(value);
        }
        else if (field == "include_pc") {
            cfg.include_pc = parse_bool(value);
        }
        else if (field == "short_func_names") {
            cfg.short_func_names = parse_bool(value);
        }
        else if (field == "show_full_path") {
            cfg.show_full_path = parse_bool(value);
        }
        else if (field == "show_line_numbers") {
            cfg.show_line_numbers = parse_bool(value);
        }
        else if (field == "frame_separator") {
            cfg.frame_separator = stackfmt::unescape(value);
        }
        else if (field == "chunk_separator") {
            cfg.chunk_separator = stackfmt::unescape(value);
        }
        else if (field == "chunk_indentation") {
            cfg.chunk_indentation = stackfmt::unescape(value);
        }
        else {
            stackfmt::error::send("Unknown option " + field);
        }
    }

    void handle_command(stackfmt::stack_trace_config& cfg,
        std::string_view line) {
        auto args = split(line, ' ');
        if (args.empty()) return;
        auto command = args[0];

        if (is_prefix(command, "trace")) {
            fmt::print("{}\n", outermost(cfg));
        }
        else if (is_prefix(command, "set")) {
            handle_set(cfg, args);
        }
        else if (is_prefix(command, "show")) {
            print_config(cfg);
        }
        else if (is_prefix(command, "reset")) {
            cfg = stackfmt::stack_trace_config{};
        }
        else if (is_prefix(command, "help")) {
            print_help(args);
        }
        else {
            std::cerr << "Unknown command\n";
        }
    }

    void main_loop(stackfmt::stack_trace_config& cfg) {
        char* line = nullptr;
        while ((line = readline("stackfmt> ")) != nullptr) {
            std::string line_str;

            if (line == std::string_view("")) {
                free(line);
                if (history_length > 0) {
                    line_str = history_list()[history_length - 1]->line;
                }
            }
            else {
                line_str = line;
                add_history(line);
                free(line);
            }

            if (!line_str.empty()) {
                try {
                    handle_command(cfg, line_str);
                }
                catch (const stackfmt::error& err) {
                    std::cout << err.what() << '\n';
                }
            }
        }
    }
}

int main(int argc, const char** argv) {
    stackfmt::stack_trace_config cfg;

    if (argc == 3 and argv[1] == std::string_view("-c")) {
        try {
            handle_command(cfg, argv[2]);
        }
        catch (const stackfmt::error& err) {
            std::cout << err.what() << '\n';
            return -1;
        }
        return 0;
    }
    else if (argc != 1) {
        std::cerr << "Usage: stackfmt [-c <command>]\n";
        return -1;
    }

    main_loop(cfg);
}
