#include <multitoken/settlement/notification.hpp>

#include <cctype>

namespace multitoken::settlement {

    namespace {
        void skipWhitespace(const std::string &s, size_t &pos) {
            while (pos < s.size() && std::isspace(static_cast<unsigned char>(s[pos])))
                ++pos;
        }

        std::optional<Balance> parseElement(const std::string &s, size_t &pos) {
            bool quoted = pos < s.size() && s[pos] == '"';
            if (quoted)
                ++pos;

            size_t start = pos;
            while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos])))
                ++pos;
            std::string digits = s.substr(start, pos - start);

            if (quoted) {
                if (pos >= s.size() || s[pos] != '"')
                    return std::nullopt;
                ++pos;
            }

            auto parsed = balance::parse(digits);
            if (!parsed.is_ok())
                return std::nullopt;
            return parsed.value();
        }
    } // namespace

    std::optional<std::vector<Balance>> parseUnusedAmounts(const std::string &payload, size_t expected) {
        size_t pos = 0;
        skipWhitespace(payload, pos);
        if (pos >= payload.size() || payload[pos] != '[')
            return std::nullopt;
        ++pos;

        std::vector<Balance> amounts;
        skipWhitespace(payload, pos);
        if (pos < payload.size() && payload[pos] == ']') {
            ++pos;
        } else {
            while (true) {
                skipWhitespace(payload, pos);
                auto value = parseElement(payload, pos);
                if (!value.has_value())
                    return std::nullopt;
                amounts.push_back(*value);

                skipWhitespace(payload, pos);
                if (pos >= payload.size())
                    return std::nullopt;
                if (payload[pos] == ',') {
                    ++pos;
                    continue;
                }
                if (payload[pos] == ']') {
                    ++pos;
                    break;
                }
                return std::nullopt;
            }
        }

        skipWhitespace(payload, pos);
        if (pos != payload.size() || amounts.size() != expected)
            return std::nullopt;
        return amounts;
    }

    std::string formatUnusedAmounts(const std::vector<Balance> &amounts) {
        std::string out = "[";
        for (size_t i = 0; i < amounts.size(); ++i) {
            if (i > 0)
                out += ",";
            out += "\"" + balance::toString(amounts[i]) + "\"";
        }
        out += "]";
        return out;
    }

} // namespace multitoken::settlement
