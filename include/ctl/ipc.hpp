#pragma once
#include <functional>
#include <string>

namespace ipc
{

// Gets the first line of a request (no trailing newline), returns the reply
// text written back to the client before the connection closes.
using Handler = std::function<std::string(const std::string &line)>;

// Serves one line per connection until a client sends QUIT.
bool        start_server(const std::string &sock_path, const Handler &on_line);
bool        send_line(const std::string &sock_path, const std::string &line,
                      std::string *reply = nullptr);
std::string expand_user(const std::string &path);

}  // namespace ipc
