// lens_error.cpp
// Implementation of lens error types

#include <optics/lens_error.h>

#include <string>

namespace optics {

IndexOutOfRange::IndexOutOfRange(std::size_t index, std::size_t size)
    : std::out_of_range("index " + std::to_string(index) +
                        " out of range for collection of size " + std::to_string(size))
    , index_(index)
    , size_(size)
{
}

} // namespace optics
