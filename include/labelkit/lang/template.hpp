#pragma once

#include <labelkit/context.hpp>
#include <labelkit/lang/condition.hpp>
#include <labelkit/log.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace labelkit {

// ---------------------------------------------------------------------------
// Directive tags
// ---------------------------------------------------------------------------

enum class TagKind { If, Elif, Else, Endif };

// One "{% ... %}" tag. [begin, end) spans the whole tag in the source;
// `condition` is the untrimmed condition text of if/elif.
struct Tag {
    TagKind kind;
    size_t begin = 0;
    size_t end = 0;
    std::string_view condition;
};

const char* tag_kind_name(TagKind k);

// Recognize a tag starting at `pos` (which must point at "{%").
//   {% if COND %}  {% elif COND %}  {% else %}  {% endif %}
// COND is a non-empty run without '%' or '}'.
std::optional<Tag> match_tag(std::string_view text, size_t pos);

// ---------------------------------------------------------------------------
// Template tree
// ---------------------------------------------------------------------------

// `condition` is empty for the else branch. Bodies are trimmed.
struct Branch {
    std::optional<Condition> condition;
    std::string body;
};

enum class NodeKind { Literal, ConditionalBlock };

struct Node {
    NodeKind kind = NodeKind::Literal;
    std::string text;               // Literal
    std::string source;             // ConditionalBlock: original if..endif text
    std::vector<Branch> branches;   // ConditionalBlock
};

// Parsed template. Blocks do not nest: an "if" closes at the first
// following "endif", and tags inside a branch body stay text. An "if"
// with no "endif" after it stays literal, as do stray elif/else/endif.
struct Template {
    std::vector<Node> nodes;

    static Template parse(std::string_view text);

    size_t block_count() const;
};

// Reduce every conditional block to the body of its selected branch: the
// first branch whose condition holds, else the else-branch, else "".
std::string resolve_blocks(const Template& tmpl, const Context& ctx,
                           const log::Logger& logger = {});

// Blocks first, then placeholders. Total: never throws, always returns a
// string; malformed pieces are kept as literal text.
std::string render(std::string_view tmpl, const Context& ctx,
                   const log::Logger& logger = {});

} // namespace labelkit
