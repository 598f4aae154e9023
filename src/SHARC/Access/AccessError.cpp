#include <SHARC/Access/AccessError.hpp>

#include <ostream>
#include <string>

namespace SHARC
{
    namespace
    {
        class AccessErrorCategoryImpl final : public std::error_category
        {
        public:
            [[nodiscard]] const char* name() const noexcept override
            {
                return "SHARC.Access";
            }

            [[nodiscard]] std::string message(int value) const override
            {
                return std::string(ToString(static_cast<AccessError>(value)));
            }

            [[nodiscard]] std::error_condition default_error_condition(int value) const noexcept override
            {
                switch (static_cast<AccessError>(value))
                {
                    case AccessError::BorrowConflict:
                        return std::errc::resource_unavailable_try_again;
                    case AccessError::UnsupportedMode:
                        return std::errc::operation_not_supported;
                    case AccessError::Poisoned:
                        return std::errc::state_not_recoverable;
                }
                return {value, *this};
            }
        };
    }// namespace

    const std::error_category& AccessErrorCategory() noexcept
    {
        static const AccessErrorCategoryImpl category {};
        return category;
    }

    std::ostream& operator<<(std::ostream& stream, AccessError error)
    {
        return stream << ToString(error);
    }
}// namespace SHARC
