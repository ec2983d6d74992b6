/*
 *    errors.hpp:
 *
 *    Copyright (C) 2017-2026 Light Lin <lxrite@gmail.com> All Rights Reserved.
 *
 */

#ifndef LIGHT_READER_ERRORS_HPP
#define LIGHT_READER_ERRORS_HPP

#include <string>

namespace lr {

// Describes a negative AVERROR code.
auto ErrorToString(int errnum) -> std::string;

// The current errno as an AVERROR code.
auto ErrnoToError() noexcept -> int;

}  // namespace lr

#endif  // LIGHT_READER_ERRORS_HPP
