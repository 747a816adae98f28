/// @file parse_error.h
/// @brief Error raised by the document readers
///
/// @copyright The MIT License (MIT)
/// @copyright Copyright (c) 2025 Parsa Amini

#ifndef BLANKLINE_CPP_PARSE_ERROR_H
#define BLANKLINE_CPP_PARSE_ERROR_H

#include <stdexcept>

namespace blankline_cpp {

/// @class ParseError
/// @brief Raised by the readers on malformed input
class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace blankline_cpp

#endif // BLANKLINE_CPP_PARSE_ERROR_H
