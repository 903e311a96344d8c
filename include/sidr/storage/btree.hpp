#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>
#include <sidr/storage/page.hpp>
#include <sidr/storage/page_reader.hpp>

#include <optional>
#include <string>
#include <unordered_set>

namespace sidr {

/**
 * A leaf entry as stored in the tree: full key and undecoded data.
 */
struct RawRecord {
    std::string key;
    std::string data;
    PageNumber page = INVALID_PAGE_NUMBER;  // Leaf the entry was read from
};

/**
 * BTreeCursor - Read-only cursor over one ESE tree.
 *
 * Branch entries carry a separator key and the child page number in
 * their last four bytes. Descent takes the first separator that is
 * greater than or equal to the sought key; an empty separator is
 * unbounded. Iteration across leaves follows the next-page pointer.
 *
 * Keys compare as unsigned byte strings (std::string's char_traits
 * compare as unsigned char).
 *
 * Every page of the tree must belong to the tree's object id; leaves
 * revisited within one scan, descents deeper than the store and
 * inconsistent flags are reported as CORRUPT_BTREE.
 */
class BTreeCursor {
public:
    /**
     * Create a cursor over the tree rooted at root.
     *
     * @param reader Page source, must outlive the cursor
     * @param root Root page of the tree
     * @param object_id Owning object id; taken from the root page when invalid
     */
    BTreeCursor(PageReader* reader, PageNumber root, ObjectId object_id = INVALID_OBJECT_ID);

    /**
     * Position on the first entry of the tree.
     *
     * @return The entry, std::nullopt for an empty tree, or an error
     */
    Result<std::optional<RawRecord>> first();

    /**
     * Advance to the following entry. Starts at the first entry when the
     * cursor has not been positioned yet.
     */
    Result<std::optional<RawRecord>> next();

    /**
     * Position on the first entry whose key is >= key.
     */
    Result<std::optional<RawRecord>> seek(const std::string& key);

    PageNumber root() const { return root_; }
    ObjectId object_id() const { return object_id_; }

private:
    // Walk from the root to a leaf; nullptr key takes the leftmost path
    Result<Page> descend(const std::string* key);

    // Read a page and check that it belongs to this tree
    Result<Page> load_tree_page(PageNumber page_number, bool expect_root);

    // Return the first live entry at or after the current position
    Result<std::optional<RawRecord>> scan_forward(const std::string* lower_bound);

    Error corrupt(const std::string& what) const;

    PageReader* reader_;
    PageNumber root_;
    ObjectId object_id_;

    Page leaf_;
    size_t index_ = 0;
    bool positioned_ = false;
    bool exhausted_ = false;
    std::unordered_set<PageNumber> visited_;
};

}  // namespace sidr
