#include "parser_error.h"

#include <cstdarg>
#include <cstdio>
#include <vector>

static std::string format_reason(const char *fmt, va_list args){
    va_list sizing;
    va_copy(sizing, args);
    int len = vsnprintf(nullptr, 0, fmt, sizing);
    va_end(sizing);
    if(len < 0)
        return std::string(fmt);

    std::vector<char> buf(len + 1);
    vsnprintf(buf.data(), buf.size(), fmt, args);
    return std::string(buf.data(), len);
}

Parser_error::Parser_error(Error_cause cause, const std::string &reason):
    std::runtime_error("Parser Error: " + reason), cause{cause} {}

Parser_error Parser_error::structure(const char *fmt, ...){
    va_list args;
    va_start(args, fmt);
    std::string reason = format_reason(fmt, args);
    va_end(args);
    return Parser_error(Error_cause::Structure, reason);
}

Parser_error Parser_error::entropy(const char *fmt, ...){
    va_list args;
    va_start(args, fmt);
    std::string reason = format_reason(fmt, args);
    va_end(args);
    return Parser_error(Error_cause::Entropy, reason);
}
