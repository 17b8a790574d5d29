#pragma once
#include <stdexcept>

namespace file_insights {
    // Failure of a whole run: the scan root cannot be read.
    class ScanError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    class StoreError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}
