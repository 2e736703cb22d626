#include <bandwidthpp/tokenizer.hpp>

#include <cctype>
#include <limits>
#include <string>

namespace leaf = boost::leaf;

namespace HumanBandwidth
{
    namespace
    {
        bool isSpace(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }

        bool isDigit(char c)
        {
            return c >= '0' && c <= '9';
        }

        bool isUnitCharacter(char c)
        {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '/';
        }

        class Tokenizer
        {
          public:
            Tokenizer(std::string_view text, UnitSystem system)
                : text_{text}
                , system_{system}
                , offset_{0}
            {}

            leaf::result<std::vector<Token>> run()
            {
                skipSpace();
                if (atEnd())
                    return leaf::new_error(ParseError::empty(offset_));

                std::vector<Token> tokens;
                while (!atEnd())
                {
                    const auto start = offset_;
                    BOOST_LEAF_AUTO(magnitude, readMagnitude());
                    skipSpace();
                    BOOST_LEAF_AUTO(unit, readUnit(magnitude));
                    tokens.push_back(Token{.magnitude = magnitude, .unit = unit, .offset = start});
                    skipSpace();
                }
                return tokens;
            }

          private:
            bool atEnd() const
            {
                return offset_ == text_.size();
            }

            void skipSpace()
            {
                while (!atEnd() && isSpace(text_[offset_]))
                    ++offset_;
            }

            leaf::result<std::uint64_t> readMagnitude()
            {
                const auto start = offset_;
                const char first = text_[offset_];
                if (!isDigit(first))
                {
                    if (isUnitCharacter(first))
                        return leaf::new_error(ParseError::numberExpected(offset_));
                    return leaf::new_error(ParseError::invalidCharacter(offset_, first));
                }

                std::uint64_t value = 0;
                for (; !atEnd() && isDigit(text_[offset_]); ++offset_)
                {
                    const auto digit = static_cast<std::uint64_t>(text_[offset_] - '0');
                    if (value > (std::numeric_limits<std::uint64_t>::max() - digit) / 10)
                        return leaf::new_error(ParseError::numberOverflow(start));
                    value = value * 10 + digit;
                }
                return value;
            }

            leaf::result<Unit const*> readUnit(std::uint64_t magnitude)
            {
                const auto start = offset_;
                while (!atEnd() && isUnitCharacter(text_[offset_]))
                    ++offset_;

                if (!atEnd() && !isSpace(text_[offset_]) && !isDigit(text_[offset_]))
                    return leaf::new_error(ParseError::invalidCharacter(offset_, text_[offset_]));

                const auto spelling = text_.substr(start, offset_ - start);
                const auto* unit = findUnit(spelling, system_);
                if (unit != nullptr)
                    return unit;
                if (system_ == UnitSystem::Binary)
                    return leaf::new_error(
                        ParseError::unknownBinaryUnit(start, offset_, std::string{spelling}, magnitude));
                return leaf::new_error(ParseError::unknownUnit(start, offset_, std::string{spelling}, magnitude));
            }

          private:
            std::string_view text_;
            UnitSystem system_;
            std::size_t offset_;
        };
    }
    //#####################################################################################################################
    leaf::result<std::vector<Token>> tokenize(std::string_view text, UnitSystem system)
    {
        return Tokenizer{text, system}.run();
    }
    //#####################################################################################################################
}
