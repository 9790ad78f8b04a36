#pragma once

#include <iostream>
#include <mailsync/detail/result.hpp>

inline void print_error(const mailsync::error_info& err)
{
    std::cout << "Error: " << mailsync::to_string(err.code) << " - " << err.message << "\n";
    if (!err.detail.empty())
        std::cout << "Detail: " << err.detail << "\n";
    if (err.sys)
        std::cout << "Sys: " << err.sys.message() << "\n";
    std::cout << "Class: " << mailsync::to_string(mailsync::classify(err.code))
              << (err.is_recoverable() ? " (recoverable)" : "") << "\n";
}
