//
// OmegaException.hpp
//

#ifndef RUMMIKUB_OMEGAEXCEPTION_HPP
#define RUMMIKUB_OMEGAEXCEPTION_HPP

#include <format>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace rummikub::core
{
    // Engine failure: a message, the code it was raised with and the throw site.
    template <typename CodeT>
    class OmegaException
    {
    public:
        OmegaException(std::string message,
                       CodeT code,
                       std::source_location const& site = std::source_location::current()) :
            message_{std::move(message)},
            code_{code},
            site_{site}
        {
        }

        [[nodiscard]]
        auto what() const noexcept -> std::string const& { return message_; }

        [[nodiscard]]
        auto code() const noexcept -> CodeT { return code_; }

        // file:line in function
        [[nodiscard]]
        auto to_str() const -> std::string
        {
            return std::format("{}:{} in `{}`", site_.file_name(), site_.line(), site_.function_name());
        }

    private:
        std::string message_;
        CodeT code_;
        std::source_location site_;
    };
}

//lets std::print take the exception directly
template <class CodeT>
struct std::formatter<rummikub::core::OmegaException<CodeT>> : std::formatter<std::string_view>
{
    template <class FormatContext>
    auto format(rummikub::core::OmegaException<CodeT> const& e, FormatContext& ctx) const
    {
        std::string const s = std::format("error {}: {} [{}]\n", static_cast<int>(e.code()), e.what(), e.to_str());
        return std::formatter<std::string_view>::format(s, ctx);
    }
};
#endif //RUMMIKUB_OMEGAEXCEPTION_HPP
