#include "lib.hpp"
#include <cctype>
#include <iomanip>

// Variadic formatter behind THROW. Includes file and line of the call site.
void error(const char* msg, const char* file, int line, ...) {
    va_list args;
    va_start(args, line);

    // two passes: size first, then write
    va_list args_copy;
    va_copy(args_copy, args);
    int required_size = std::vsnprintf(nullptr, 0, msg, args_copy);
    va_end(args_copy);

    if (required_size < 0) {
        va_end(args);
        throw std::runtime_error(std::string(file) + ":" + std::to_string(line) + ": " + msg);
    }

    std::vector<char> buffer(required_size + 1);
    std::vsnprintf(buffer.data(), buffer.size(), msg, args);
    va_end(args);

    std::stringstream ss;
    ss << file << ":" << line << ": " << buffer.data();
    throw std::runtime_error(ss.str());
}

std::string join(const std::vector<std::string>& xs, const char* sep) {
    std::ostringstream os;
    for (size_t i = 0; i < xs.size(); ++i) {
        if (i) os << sep;
        os << xs[i];
    }
    return os.str();
}

std::string qi(const std::string& ident) {
    std::string out;
    out.reserve(ident.size() + 2);
    out += '"';
    for (char c : ident) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string qs(const std::string& text) {
    std::string out;
    out.reserve(text.size() + 2);
    out += '\'';
    for (char c : text) {
        if (c == '\'') out += '\'';
        out += c;
    }
    out += '\'';
    return out;
}

std::string fnv1a_hex(const std::string& data) {
    uint64_t h = 14695981039346656037ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    std::ostringstream os;
    os << std::hex << std::setw(16) << std::setfill('0') << h;
    return os.str();
}

bool is_identifier(const std::string& name) {
    if (name.empty()) return false;
    unsigned char first = static_cast<unsigned char>(name[0]);
    if (!(std::isalpha(first) || first == '_')) return false;
    for (unsigned char c : name) {
        if (!(std::isalnum(c) || c == '_')) return false;
    }
    return true;
}
