#include "mcp/mcp_stdio.hpp"

#include <iostream>
#include <string>

// Framing uses brace counting with string/escape awareness, so it works both
// with newline-delimited and streamed JSON.

namespace mcp_stdio {

std::string read_message(std::istream &input) {
    std::string buffer;
    int brace_depth = 0;
    bool inside_string = false;
    bool escape_next = false;

    char character;
    while (input.get(character)) {
        if (brace_depth == 0) {
            // Anything between objects (whitespace, newlines, stray bytes) is skipped.
            if (character == '{') {
                brace_depth = 1;
                buffer += character;
            }
            continue;
        }

        buffer += character;

        if (escape_next) {
            escape_next = false;
        } else if (inside_string) {
            if (character == '\\') {
                escape_next = true;
            } else if (character == '"') {
                inside_string = false;
            }
        } else if (character == '"') {
            inside_string = true;
        } else if (character == '{') {
            brace_depth++;
        } else if (character == '}' && --brace_depth == 0) {
            return buffer;
        }
    }

    return "";
}

std::string read_message() {
    return read_message(std::cin);
}

void write_message(std::ostream &output, const std::string &json_string) {
    output << json_string << "\n";
    output.flush();
}

void write_message(const std::string &json_string) {
    write_message(std::cout, json_string);
}

void log_message(const std::string &message) {
    std::cerr << "[trmcps] " << message << std::endl;
}

} // namespace mcp_stdio
