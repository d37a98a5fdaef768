#ifndef INCLUDE_CLOAK_CORE_ERRORS_HPP
#define INCLUDE_CLOAK_CORE_ERRORS_HPP

#include <stdexcept>

namespace cloak::core
{

// A caller asked a SensitiveValue for something its policy forbids.
class MisuseError final : public std::logic_error
{
public:
    using std::logic_error::logic_error;
};

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_ERRORS_HPP
