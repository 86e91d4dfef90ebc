//
// Created by Giuseppe Francione on 21/10/25.
//

#include "../../include/svg_processor.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace pixtrim {

namespace {

    constexpr std::array<std::string_view, 4> editor_prefixes = {"inkscape:", "sodipodi:", "sketch:", "serif:"};
    constexpr std::array<std::string_view, 5> text_elements = {"text", "tspan", "textPath", "title", "desc"};

    bool is_space(const char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r';
    }

    bool is_blank(const std::string_view s) {
        return std::ranges::all_of(s, is_space);
    }

    std::string_view local_name(const std::string_view qname) {
        const auto colon = qname.find(':');
        return colon == std::string_view::npos ? qname : qname.substr(colon + 1);
    }

    bool is_editor_attribute(const std::string_view name) {
        if (name.starts_with("adobe-")) return true;
        return std::ranges::any_of(editor_prefixes, [&](const std::string_view p) { return name.starts_with(p); });
    }

    bool is_dropped_element(const std::string_view name) {
        return local_name(name) == "metadata" || name == "sodipodi:namedview";
    }

    bool is_text_element(const std::string_view name) {
        return std::ranges::find(text_elements, local_name(name)) != text_elements.end();
    }

    struct Attribute {
        std::string_view name;
        std::string_view quoted_value; // includes the quotes
    };

    struct StartTag {
        std::string_view name;
        std::vector<Attribute> attributes;
        bool self_closing = false;
        std::string_view raw;
    };

    struct Frame {
        std::string name;
        bool dropped;
        bool preserve;
        bool text_content;
    };

    /**
     * @brief Single-pass tokenizer/rewriter over the SVG text.
     *
     * Text is buffered in `pending_` so that whitespace on both sides of a
     * removed comment or element collapses as one run.
     */
    class SvgRewriter {
    public:
        explicit SvgRewriter(const std::string_view src) : src_(src) {
            out_.reserve(src.size());
        }

        std::string run() {
            if (src_.starts_with("\xEF\xBB\xBF")) {
                out_.append(src_.substr(0, 3));
                pos_ = 3;
            }
            while (pos_ < src_.size()) {
                if (src_[pos_] == '<') {
                    markup();
                } else {
                    text();
                }
            }
            if (!stack_.empty()) {
                fail("unclosed element <" + stack_.back().name + ">");
            }
            if (!seen_root_) {
                fail("no root element");
            }
            flush_pending();
            return std::move(out_);
        }

    private:
        [[noreturn]] void fail(const std::string& what) const {
            throw FileError(FileErrorKind::DecodeError,
                            "malformed SVG at offset " + std::to_string(pos_) + ": " + what);
        }

        [[nodiscard]] bool dropping() const {
            return std::ranges::any_of(stack_, [](const Frame& f) { return f.dropped; });
        }

        [[nodiscard]] bool preserving() const {
            return !stack_.empty() && stack_.back().preserve;
        }

        [[nodiscard]] bool in_text_content() const {
            return !stack_.empty() && stack_.back().text_content;
        }

        void flush_pending() {
            if (pending_.empty()) return;
            if (is_blank(pending_)) {
                if (in_text_content()) out_ += ' ';
            } else {
                bool in_run = false;
                for (const char c : pending_) {
                    if (is_space(c)) {
                        if (!in_run) out_ += ' ';
                        in_run = true;
                    } else {
                        out_ += c;
                        in_run = false;
                    }
                }
            }
            pending_.clear();
        }

        void emit(const std::string_view s) {
            if (dropping()) return;
            flush_pending();
            out_.append(s);
        }

        std::size_t find_or_fail(const std::string_view needle, const std::size_t from, const char *what) const {
            const auto at = src_.find(needle, from);
            if (at == std::string_view::npos) fail(std::string("unterminated ") + what);
            return at;
        }

        void text() {
            const auto end = std::min(src_.find('<', pos_), src_.size());
            const auto chunk = src_.substr(pos_, end - pos_);
            pos_ = end;
            if (dropping()) return;
            if (preserving()) {
                out_.append(chunk);
            } else {
                pending_.append(chunk);
            }
        }

        void markup() {
            const auto rest = src_.substr(pos_);
            if (rest.starts_with("<!--")) {
                const auto end = find_or_fail("-->", pos_ + 4, "comment") + 3;
                if (preserving()) emit(src_.substr(pos_, end - pos_));
                pos_ = end;
            } else if (rest.starts_with("<![CDATA[")) {
                const auto end = find_or_fail("]]>", pos_ + 9, "CDATA section") + 3;
                emit(src_.substr(pos_, end - pos_));
                pos_ = end;
            } else if (rest.starts_with("<?")) {
                const auto end = find_or_fail("?>", pos_ + 2, "processing instruction") + 2;
                emit(src_.substr(pos_, end - pos_));
                pos_ = end;
            } else if (rest.starts_with("<!DOCTYPE")) {
                doctype();
            } else if (rest.starts_with("</")) {
                end_tag();
            } else if (rest.size() > 1 && !is_space(rest[1]) && rest[1] != '!' && rest[1] != '>') {
                start_tag();
            } else {
                fail("stray '<'");
            }
        }

        void doctype() {
            const auto start = pos_;
            int depth = 0;
            char quote = 0;
            for (std::size_t i = pos_ + 9; i < src_.size(); ++i) {
                const char c = src_[i];
                if (quote) {
                    if (c == quote) quote = 0;
                } else if (c == '"' || c == '\'') {
                    quote = c;
                } else if (c == '[') {
                    ++depth;
                } else if (c == ']') {
                    --depth;
                } else if (c == '>' && depth <= 0) {
                    pos_ = i + 1;
                    emit(src_.substr(start, pos_ - start));
                    return;
                }
            }
            fail("unterminated DOCTYPE");
        }

        std::string_view read_name() {
            const auto start = pos_;
            while (pos_ < src_.size() && !is_space(src_[pos_]) && src_[pos_] != '/' && src_[pos_] != '>'
                   && src_[pos_] != '=') {
                ++pos_;
            }
            if (pos_ == start) fail("expected a name");
            return src_.substr(start, pos_ - start);
        }

        void skip_space() {
            while (pos_ < src_.size() && is_space(src_[pos_])) ++pos_;
        }

        StartTag parse_start_tag() {
            StartTag tag;
            const auto start = pos_;
            ++pos_;
            tag.name = read_name();
            while (true) {
                skip_space();
                if (pos_ >= src_.size()) fail("unterminated tag <" + std::string(tag.name) + ">");
                if (src_[pos_] == '>') {
                    ++pos_;
                    break;
                }
                if (src_.substr(pos_).starts_with("/>")) {
                    pos_ += 2;
                    tag.self_closing = true;
                    break;
                }
                Attribute attr;
                attr.name = read_name();
                skip_space();
                if (pos_ >= src_.size() || src_[pos_] != '=') {
                    fail("attribute '" + std::string(attr.name) + "' has no value");
                }
                ++pos_;
                skip_space();
                if (pos_ >= src_.size() || (src_[pos_] != '"' && src_[pos_] != '\'')) {
                    fail("unquoted value for attribute '" + std::string(attr.name) + "'");
                }
                const char quote = src_[pos_];
                const auto close = find_or_fail(std::string_view(&quote, 1), pos_ + 1, "attribute value");
                attr.quoted_value = src_.substr(pos_, close + 1 - pos_);
                pos_ = close + 1;
                tag.attributes.push_back(attr);
            }
            tag.raw = src_.substr(start, pos_ - start);
            return tag;
        }

        static std::string normalize(const StartTag& tag) {
            std::string s = "<";
            s.append(tag.name);
            for (const auto& [name, value] : tag.attributes) {
                if (is_editor_attribute(name)) continue;
                s += ' ';
                s.append(name);
                s += '=';
                s.append(value);
            }
            s.append(tag.self_closing ? "/>" : ">");
            return s;
        }

        static bool has_preserve_space(const StartTag& tag) {
            return std::ranges::any_of(tag.attributes, [](const Attribute& a) {
                return a.name == "xml:space" && a.quoted_value.substr(1, a.quoted_value.size() - 2) == "preserve";
            });
        }

        void start_tag() {
            if (stack_.empty()) {
                if (seen_root_) fail("content after the root element");
                seen_root_ = true;
            }
            const StartTag tag = parse_start_tag();
            const bool inherited_preserve = preserving();
            const bool dropped = !inherited_preserve && is_dropped_element(tag.name);
            const bool preserve = inherited_preserve || has_preserve_space(tag);

            if (dropped) {
                if (!tag.self_closing) {
                    stack_.push_back({std::string(tag.name), true, false, false});
                }
                return;
            }

            emit(preserve ? tag.raw : std::string_view(normalize(tag)));
            if (tag.self_closing) return;

            const auto lname = local_name(tag.name);
            if (lname == "style" || lname == "script") {
                raw_body(tag.name, preserve);
                return;
            }
            stack_.push_back({std::string(tag.name), false, preserve, in_text_content() || is_text_element(tag.name)});
        }

        // copies everything up to the matching end tag, then the end tag
        void raw_body(const std::string_view name, const bool preserve) {
            const std::string closing = "</" + std::string(name);
            std::size_t at = pos_;
            while (true) {
                at = find_or_fail(closing, at, "<style>/<script> element");
                const auto after = at + closing.size();
                if (after < src_.size() && (src_[after] == '>' || is_space(src_[after]))) break;
                at = after;
            }
            emit(src_.substr(pos_, at - pos_));
            pos_ = at;
            const auto tag_start = pos_;
            pos_ += 2;
            read_name();
            skip_space();
            if (pos_ >= src_.size() || src_[pos_] != '>') fail("unterminated end tag");
            ++pos_;
            emit(preserve ? src_.substr(tag_start, pos_ - tag_start) : std::string_view(closing + ">"));
        }

        void end_tag() {
            const auto start = pos_;
            pos_ += 2;
            const auto name = read_name();
            skip_space();
            if (pos_ >= src_.size() || src_[pos_] != '>') fail("unterminated end tag");
            ++pos_;
            if (stack_.empty() || stack_.back().name != name) {
                fail("unexpected end tag </" + std::string(name) + ">");
            }
            const Frame frame = stack_.back();
            if (frame.dropped) {
                stack_.pop_back();
                return;
            }
            if (frame.preserve) {
                emit(src_.substr(start, pos_ - start));
            } else {
                emit("</" + std::string(name) + ">");
            }
            stack_.pop_back();
        }

        std::string_view src_;
        std::size_t pos_ = 0;
        std::string out_;
        std::string pending_;
        std::vector<Frame> stack_;
        bool seen_root_ = false;
    };

} // namespace

std::string SvgProcessor::minify(const std::string_view svg) {
    return SvgRewriter(svg).run();
}

Bytes SvgProcessor::optimize(const ByteView input, const RunConfig&) const {
    const std::string_view text(reinterpret_cast<const char *>(input.data()), input.size());
    const std::string result = minify(text);
    Logger::log(LogLevel::Debug,
                "SVG rewrite " + std::to_string(input.size()) + " -> " + std::to_string(result.size()) + " bytes",
                "svg_processor");
    return {result.begin(), result.end()};
}

} // namespace pixtrim
