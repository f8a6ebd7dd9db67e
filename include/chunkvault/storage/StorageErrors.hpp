#ifndef INCLUDE_CHUNKVAULT_STORAGE_STORAGEERRORS_HPP
#define INCLUDE_CHUNKVAULT_STORAGE_STORAGEERRORS_HPP

#include <stdexcept>

namespace chunkvault::storage
{

class FileNotFound final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

} // namespace chunkvault::storage

#endif // INCLUDE_CHUNKVAULT_STORAGE_STORAGEERRORS_HPP
