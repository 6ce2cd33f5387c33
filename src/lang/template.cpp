#include <labelkit/lang/template.hpp>
#include <labelkit/lang/interpolate.hpp>
#include <labelkit/text.hpp>
#include <exception>

namespace labelkit {

const char* tag_kind_name(TagKind k) {
    switch (k) {
        case TagKind::If:    return "if";
        case TagKind::Elif:  return "elif";
        case TagKind::Else:  return "else";
        case TagKind::Endif: return "endif";
    }
    return "?";
}

// ---------------------------------------------------------------------------
// Tag matching
// ---------------------------------------------------------------------------

namespace {

struct TagScanner {
    std::string_view text;
    size_t pos;

    bool at_end() const { return pos >= text.size(); }

    void skip_spaces() {
        while (!at_end() && is_space(text[pos])) ++pos;
    }

    bool consume(std::string_view word) {
        if (text.compare(pos, word.size(), word) != 0) return false;
        pos += word.size();
        return true;
    }

    // "%}" closing the tag, optionally preceded by whitespace.
    bool close() {
        skip_spaces();
        return consume("%}");
    }

    // One mandatory whitespace character, then a run without '%' or '}',
    // then "%}". The run keeps any further leading or trailing whitespace.
    bool condition(std::string_view& out) {
        if (at_end() || !is_space(text[pos])) return false;
        ++pos;
        size_t start = pos;
        while (!at_end() && text[pos] != '%' && text[pos] != '}') ++pos;
        if (pos == start) return false;
        out = text.substr(start, pos - start);
        return consume("%}");
    }
};

} // namespace

std::optional<Tag> match_tag(std::string_view text, size_t pos) {
    TagScanner s{text, pos};
    if (!s.consume("{%")) return std::nullopt;
    s.skip_spaces();

    Tag tag;
    tag.begin = pos;

    if (s.consume("endif")) {
        if (!s.close()) return std::nullopt;
        tag.kind = TagKind::Endif;
    } else if (s.consume("else")) {
        if (!s.close()) return std::nullopt;
        tag.kind = TagKind::Else;
    } else if (s.consume("elif")) {
        if (!s.condition(tag.condition)) return std::nullopt;
        tag.kind = TagKind::Elif;
    } else if (s.consume("if")) {
        if (!s.condition(tag.condition)) return std::nullopt;
        tag.kind = TagKind::If;
    } else {
        return std::nullopt;
    }

    tag.end = s.pos;
    return tag;
}

// ---------------------------------------------------------------------------
// Parsing
// ---------------------------------------------------------------------------

static Node literal_node(std::string_view text) {
    Node node;
    node.kind = NodeKind::Literal;
    node.text = std::string(text);
    return node;
}

// Build the block for `open` .. `endif` given the elif/else markers in
// between, in source order.
static Node block_node(std::string_view text, const Tag& open,
                       const std::vector<Tag>& markers, const Tag& endif) {
    Node node;
    node.kind = NodeKind::ConditionalBlock;
    node.source = std::string(text.substr(open.begin, endif.end - open.begin));

    auto body = [&](size_t from, size_t to) {
        return trim(text.substr(from, to - from));
    };

    size_t first_end = markers.empty() ? endif.begin : markers.front().begin;
    node.branches.push_back({parse_condition(open.condition), body(open.end, first_end)});

    for (size_t i = 0; i < markers.size(); ++i) {
        const Tag& m = markers[i];
        size_t to = (i + 1 < markers.size()) ? markers[i + 1].begin : endif.begin;
        Branch branch;
        if (m.kind == TagKind::Elif) branch.condition = parse_condition(m.condition);
        branch.body = body(m.end, to);
        node.branches.push_back(std::move(branch));
    }

    return node;
}

Template Template::parse(std::string_view text) {
    Template tmpl;
    size_t pos = 0;
    size_t literal_start = 0;

    while (true) {
        size_t at = text.find("{%", pos);
        if (at == std::string_view::npos) break;

        auto open = match_tag(text, at);
        if (!open || open->kind != TagKind::If) {
            pos = at + 2;
            continue;
        }

        // Collect elif markers and the first else up to the closing endif.
        std::vector<Tag> markers;
        std::optional<Tag> endif;
        bool seen_else = false;
        size_t scan = open->end;
        while (true) {
            size_t next = text.find("{%", scan);
            if (next == std::string_view::npos) break;
            auto tag = match_tag(text, next);
            if (!tag) {
                scan = next + 2;
                continue;
            }
            if (tag->kind == TagKind::Endif) {
                endif = tag;
                break;
            }
            if (tag->kind == TagKind::Elif) {
                markers.push_back(*tag);
            } else if (tag->kind == TagKind::Else && !seen_else) {
                markers.push_back(*tag);
                seen_else = true;
            }
            scan = tag->end;
        }

        // Without an endif here, no later "if" can be closed either.
        if (!endif) break;

        if (at > literal_start) {
            tmpl.nodes.push_back(literal_node(text.substr(literal_start, at - literal_start)));
        }
        tmpl.nodes.push_back(block_node(text, *open, markers, *endif));
        pos = endif->end;
        literal_start = pos;
    }

    if (literal_start < text.size()) {
        tmpl.nodes.push_back(literal_node(text.substr(literal_start)));
    }
    return tmpl;
}

size_t Template::block_count() const {
    size_t n = 0;
    for (const auto& node : nodes) {
        if (node.kind == NodeKind::ConditionalBlock) ++n;
    }
    return n;
}

// ---------------------------------------------------------------------------
// Rendering
// ---------------------------------------------------------------------------

static const std::string* select_branch(const Node& block, const Context& ctx,
                                        const log::Logger& logger) {
    for (const auto& branch : block.branches) {
        if (!branch.condition) return &branch.body;
        if (evaluate(*branch.condition, ctx, logger)) return &branch.body;
    }
    return nullptr;
}

std::string resolve_blocks(const Template& tmpl, const Context& ctx,
                           const log::Logger& logger) {
    std::string out;
    for (const auto& node : tmpl.nodes) {
        if (node.kind == NodeKind::Literal) {
            out += node.text;
            continue;
        }
        if (const std::string* body = select_branch(node, ctx, logger)) {
            out += *body;
        }
    }
    return out;
}

std::string render(std::string_view tmpl, const Context& ctx,
                   const log::Logger& logger) {
    try {
        auto parsed = Template::parse(tmpl);
        return interpolate(resolve_blocks(parsed, ctx, logger), ctx, logger);
    } catch (const std::exception& e) {
        logger.error("render failed, returning template unchanged: %s", e.what());
        return std::string(tmpl);
    }
}

} // namespace labelkit
