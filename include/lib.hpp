#pragma once
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdarg>
#include <cstdio>
#include <cstdint>
#include <functional>
#include <sstream>

using str = std::string;
using er = std::runtime_error;

[[noreturn]] void error(const char* msg, const char* file, int line, ...);
// printf-style formatting, stamped with __FILE__ and __LINE__ of the call site.
// Pass std::string arguments as .c_str().
#define THROW(msg, ...) error(msg, __FILE__, __LINE__, ##__VA_ARGS__)

// tiny scope guard
struct Finally {
    std::function<void()> f;
    explicit Finally(std::function<void()> fn)
        : f(std::move(fn)) { }
    ~Finally() {
        if (f) {
            f();
        }
    }
    Finally(const Finally&) = delete;
    Finally& operator=(const Finally&) = delete;
    Finally(Finally&& other) noexcept
        : f(std::move(other.f)) { other.f = nullptr; }
};

std::string join(const std::vector<std::string>& xs, const char* sep);

// "name" with embedded double quotes doubled; valid in both SQLite and Postgres.
std::string qi(const std::string& ident);

// 'text' with embedded single quotes doubled.
std::string qs(const std::string& text);

// 16 hex chars, FNV-1a 64.
std::string fnv1a_hex(const std::string& data);

bool is_identifier(const std::string& name);
