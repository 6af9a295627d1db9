#include "core/json_document.hpp"

#include <cstdint>
#include <utility>
#include <vector>

namespace uisanitizer {

namespace {

using json = nlohmann::ordered_json;

/**
 * @brief SAX handler that builds an ordered_json tree
 *
 * Mirrors nlohmann's own DOM builder, plus the nesting limit and the
 * wide-integer handling described in json_document.hpp.
 */
class DocumentBuilder {
public:
    using number_integer_t = json::number_integer_t;
    using number_unsigned_t = json::number_unsigned_t;
    using number_float_t = json::number_float_t;
    using string_t = json::string_t;
    using binary_t = json::binary_t;

    explicit DocumentBuilder(json& root) : root_(root) {}

    bool null() {
        add(nullptr);
        return true;
    }

    bool boolean(bool value) {
        add(value);
        return true;
    }

    bool number_integer(number_integer_t value) {
        add(value);
        return true;
    }

    bool number_unsigned(number_unsigned_t value) {
        add(value);
        return true;
    }

    // Integers that overflow 64 bits arrive here with their source text
    bool number_float(number_float_t value, const string_t& lexeme) {
        if (lexeme.find_first_of(".eE") == string_t::npos) {
            add(json::binary(std::vector<std::uint8_t>(lexeme.begin(), lexeme.end())));
        } else {
            add(value);
        }
        return true;
    }

    bool string(string_t& value) {
        add(std::move(value));
        return true;
    }

    // Only reached by binary formats, never by JSON text
    bool binary(binary_t& /*value*/) {
        return false;
    }

    bool start_object(std::size_t /*elements*/) {
        return open(json::object());
    }

    bool key(string_t& name) {
        slot_ = &(*stack_.back())[name];
        return true;
    }

    bool end_object() {
        stack_.pop_back();
        return true;
    }

    bool start_array(std::size_t /*elements*/) {
        return open(json::array());
    }

    bool end_array() {
        stack_.pop_back();
        return true;
    }

    bool parse_error(std::size_t /*position*/, const std::string& /*last_token*/,
                     const json::exception& /*ex*/) {
        return false;
    }

private:
    json* add(json value) {
        if (stack_.empty()) {
            root_ = std::move(value);
            return &root_;
        }
        json& parent = *stack_.back();
        if (parent.is_array()) {
            parent.push_back(std::move(value));
            return &parent.back();
        }
        *slot_ = std::move(value);
        return slot_;
    }

    bool open(json container) {
        if (stack_.size() >= JsonDocument::kMaxDepth) return false;
        stack_.push_back(add(std::move(container)));
        return true;
    }

    json& root_;
    std::vector<json*> stack_;
    json* slot_ = nullptr;
};

void write_value(const json& node, std::string& out) {
    if (node.is_object()) {
        out += '{';
        bool first = true;
        for (auto it = node.begin(); it != node.end(); ++it) {
            if (!first) out += ", ";
            first = false;
            out += json(it.key()).dump(-1, ' ', false, json::error_handler_t::replace);
            out += ": ";
            write_value(it.value(), out);
        }
        out += '}';
    } else if (node.is_array()) {
        out += '[';
        bool first = true;
        for (const auto& child : node) {
            if (!first) out += ", ";
            first = false;
            write_value(child, out);
        }
        out += ']';
    } else if (node.is_binary()) {
        const auto& literal = node.get_binary();
        out.append(literal.begin(), literal.end());
    } else {
        out += node.dump(-1, ' ', /*ensure_ascii=*/false, json::error_handler_t::replace);
    }
}

} // anonymous namespace

Result<nlohmann::ordered_json> JsonDocument::parse(std::string_view text) {
    json root;
    DocumentBuilder builder(root);
    if (!json::sax_parse(text, &builder)) {
        return Result<json>::error(ErrorCategory::PARSE_ERROR, "input is not valid JSON");
    }
    return Result<json>::ok(std::move(root));
}

std::string JsonDocument::serialize(const nlohmann::ordered_json& doc) {
    std::string out;
    write_value(doc, out);
    return out;
}

} // namespace uisanitizer
