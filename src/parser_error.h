#pragma once
#include <stdexcept>
#include <string>

enum class Error_cause {
    Structure,  //bad prefix, bad length, truncated buffer, bad table
    Entropy     //no code matched at a bit cursor
};

class Parser_error: public std::runtime_error{
public:
    Parser_error(Error_cause cause, const std::string &reason);
    Error_cause get_cause() const {return this->cause;}

    static Parser_error structure(const char *fmt, ...);
    static Parser_error entropy(const char *fmt, ...);

private:
    Error_cause cause;
};
