#ifndef TRMCPS_MCP_STDIO_HPP
#define TRMCPS_MCP_STDIO_HPP

// MCP stdio transport: JSON messages in on stdin, out on stdout.
// Logs go to stderr, never stdout.

#include <iosfwd>
#include <string>

namespace mcp_stdio {

// Read a single complete JSON object from input. Returns the raw JSON text,
// or an empty string on EOF before a complete object.
std::string read_message(std::istream &input);
std::string read_message();

// Write one message followed by a newline and flush.
void write_message(std::ostream &output, const std::string &json_string);
void write_message(const std::string &json_string);

// Write a log line to stderr.
void log_message(const std::string &message);

} // namespace mcp_stdio

#endif // TRMCPS_MCP_STDIO_HPP
