#include <labelkit/lang/interpolate.hpp>
#include <labelkit/text.hpp>

namespace labelkit {

std::vector<Segment> split_placeholders(std::string_view text) {
    std::vector<Segment> segments;
    size_t pos = 0;
    size_t literal_start = 0;

    auto flush_literal = [&](size_t end) {
        if (end > literal_start) {
            segments.push_back({SegmentKind::Literal,
                                text.substr(literal_start, end - literal_start), {}});
        }
    };

    while (pos < text.size()) {
        size_t open = text.find("{{", pos);
        if (open == std::string_view::npos) break;
        size_t close = text.find("}}", open + 2);
        if (close == std::string_view::npos) break;

        // "{{{name}}" : the marker starts at the innermost "{{".
        open = text.rfind("{{", close);

        auto name = trim_view(text.substr(open + 2, close - open - 2));
        if (name.empty()) {
            pos = close + 2;
            continue;
        }

        flush_literal(open);
        segments.push_back({SegmentKind::Placeholder,
                            text.substr(open, close + 2 - open), name});
        pos = close + 2;
        literal_start = pos;
    }

    flush_literal(text.size());
    return segments;
}

std::string interpolate(std::string_view text, const Context& ctx,
                        const log::Logger& logger) {
    std::string out;
    out.reserve(text.size());

    for (const auto& seg : split_placeholders(text)) {
        if (seg.kind == SegmentKind::Literal) {
            out.append(seg.raw);
            continue;
        }

        const Value* value = ctx.find(std::string(seg.name));
        if (!value) {
            logger.debug("unresolved placeholder '%.*s' left as-is",
                         static_cast<int>(seg.name.size()), seg.name.data());
            out.append(seg.raw);
            continue;
        }

        std::string shown = value->display();
        logger.trace("replacing {{%.*s}} with \"%s\"",
                     static_cast<int>(seg.name.size()), seg.name.data(),
                     shown.c_str());
        out += shown;
    }

    return out;
}

} // namespace labelkit
