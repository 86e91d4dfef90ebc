//
// Created by Giuseppe Francione on 21/10/25.
//

#ifndef PIXTRIM_SVG_PROCESSOR_HPP
#define PIXTRIM_SVG_PROCESSOR_HPP

#include "image_format.hpp"
#include "processor.hpp"
#include "run_config.hpp"
#include <string>
#include <string_view>

namespace pixtrim {

    /**
     * @brief Conservative SVG text cleanup.
     *
     * @details Removes comments, `<metadata>` and `<sodipodi:namedview>`
     * elements, attributes in the inkscape/sodipodi/sketch/serif namespaces
     * and `adobe-*` attributes, and collapses whitespace:
     * - whitespace-only text between tags disappears, except inside text
     *   content elements (`text`, `tspan`, `textPath`, `title`, `desc`)
     *   where it becomes a single space;
     * - whitespace runs in other text become one space;
     * - tags are rewritten with one space between attributes.
     *
     * Attribute values, `<style>`/`<script>` bodies, CDATA sections,
     * processing instructions, the DOCTYPE and `xml:space="preserve"`
     * subtrees are copied byte for byte. The transform is idempotent.
     * Quality, lossless and resize settings do not apply.
     */
    class SvgProcessor {
    public:
        static constexpr std::string_view name = "SvgProcessor";
        static constexpr ImageFormat format = ImageFormat::Svg;

        /**
         * @throws FileError(DecodeError) on malformed markup (unterminated
         * tokens, mismatched or unclosed elements, no root element).
         */
        [[nodiscard]] Bytes optimize(ByteView input, const RunConfig& config) const;

        /// Text-level entry point used by optimize().
        [[nodiscard]] static std::string minify(std::string_view svg);
    };

} // namespace pixtrim

#endif // PIXTRIM_SVG_PROCESSOR_HPP
