#include <sidr/storage/btree.hpp>
#include <sidr/util/serializer.hpp>

namespace sidr {

BTreeCursor::BTreeCursor(PageReader* reader, PageNumber root, ObjectId object_id)
    : reader_(reader)
    , root_(root)
    , object_id_(object_id)
{}

Error BTreeCursor::corrupt(const std::string& what) const {
    return Err(ErrorCode::CORRUPT_BTREE, "tree at page " + std::to_string(root_) + ": " + what);
}

Result<Page> BTreeCursor::load_tree_page(PageNumber page_number, bool expect_root) {
    auto page = reader_->read_page(page_number);
    if (!page.ok()) {
        return page.error();
    }

    if (expect_root && object_id_ == INVALID_OBJECT_ID) {
        object_id_ = page->father_object_id();
    }
    if (page->father_object_id() != object_id_) {
        return corrupt("page " + std::to_string(page_number) + " belongs to object " +
                       std::to_string(page->father_object_id()));
    }
    if (page->is_empty()) {
        return corrupt("empty page " + std::to_string(page_number) + " inside the tree");
    }
    if (!expect_root && page->is_root()) {
        return corrupt("page " + std::to_string(page_number) + " is flagged as root");
    }
    return page;
}

Result<Page> BTreeCursor::descend(const std::string* key) {
    auto page = load_tree_page(root_, true);
    if (!page.ok()) {
        return page.error();
    }

    size_t depth = 0;
    while (page->is_branch()) {
        const Page& branch = *page;

        std::optional<PageNode> chosen;
        for (size_t i = 0; i < branch.entry_count(); ++i) {
            auto node = branch.entry(i);
            if (!node.ok()) {
                return node.error();
            }
            if (node->is_deleted()) {
                continue;
            }
            chosen = std::move(*node);
            if (key == nullptr || chosen->key.empty() || chosen->key >= *key) {
                break;
            }
        }
        if (!chosen) {
            return corrupt("branch page " + std::to_string(branch.number()) + " has no children");
        }
        if (chosen->data.size() < 4) {
            return corrupt("branch entry on page " + std::to_string(branch.number()) +
                           " has no child pointer");
        }

        PageNumber child = load_le32(chosen->data.data() + chosen->data.size() - 4);
        if (++depth > reader_->page_count()) {
            return corrupt("descent deeper than the store");
        }

        auto next = load_tree_page(child, false);
        if (!next.ok()) {
            return next.error();
        }
        page = std::move(next);
    }
    return page;
}

Result<std::optional<RawRecord>> BTreeCursor::first() {
    visited_.clear();
    positioned_ = true;
    exhausted_ = false;

    auto leaf = descend(nullptr);
    if (!leaf.ok()) {
        return leaf.error();
    }
    leaf_ = std::move(*leaf);
    visited_.insert(leaf_.number());
    index_ = 0;
    return scan_forward(nullptr);
}

Result<std::optional<RawRecord>> BTreeCursor::next() {
    if (!positioned_) {
        return first();
    }
    if (exhausted_) {
        return std::optional<RawRecord>();
    }
    ++index_;
    return scan_forward(nullptr);
}

Result<std::optional<RawRecord>> BTreeCursor::seek(const std::string& key) {
    visited_.clear();
    positioned_ = true;
    exhausted_ = false;

    auto leaf = descend(&key);
    if (!leaf.ok()) {
        return leaf.error();
    }
    leaf_ = std::move(*leaf);
    visited_.insert(leaf_.number());
    index_ = 0;
    return scan_forward(&key);
}

Result<std::optional<RawRecord>> BTreeCursor::scan_forward(const std::string* lower_bound) {
    while (true) {
        for (; index_ < leaf_.entry_count(); ++index_) {
            auto node = leaf_.entry(index_);
            if (!node.ok()) {
                return node.error();
            }
            if (node->is_deleted()) {
                continue;
            }
            if (lower_bound != nullptr && node->key < *lower_bound) {
                continue;
            }

            RawRecord record;
            record.key = std::move(node->key);
            record.data = std::move(node->data);
            record.page = leaf_.number();
            return std::optional<RawRecord>(std::move(record));
        }

        PageNumber next_page = leaf_.next_page();
        if (next_page == INVALID_PAGE_NUMBER) {
            exhausted_ = true;
            return std::optional<RawRecord>();
        }
        if (visited_.count(next_page) > 0 || visited_.size() >= reader_->page_count()) {
            exhausted_ = true;
            return corrupt("leaf " + std::to_string(next_page) + " revisited");
        }

        auto page = load_tree_page(next_page, false);
        if (!page.ok()) {
            exhausted_ = true;
            return page.error();
        }
        if (!page->is_leaf()) {
            exhausted_ = true;
            return corrupt("next pointer of page " + std::to_string(leaf_.number()) +
                           " leads to non-leaf " + std::to_string(next_page));
        }

        leaf_ = std::move(*page);
        visited_.insert(next_page);
        index_ = 0;
    }
}

}  // namespace sidr
