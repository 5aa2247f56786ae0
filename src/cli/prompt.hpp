#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cli {

// Numbered menus. Empty input picks the default; anything that is not a
// listed number falls back to the default with a notice.
std::string choose_language(std::istream& in, std::ostream& out, std::string_view default_code);
std::string choose_model(std::istream& in, std::ostream& out, std::string_view default_model);

// Reads a path typed (or dropped) into the terminal. Surrounding quotes and
// a leading ~ are handled. nullopt on empty input, EOF or a path that is not
// an existing file.
std::optional<std::string> ask_file_path(std::istream& in, std::ostream& out);

// Native picker first, then the typed fallback.
std::optional<std::string> select_input_file(std::istream& in, std::ostream& out);

} // namespace cli
