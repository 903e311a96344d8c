#pragma once

#include <sidr/core_types.hpp>
#include <sidr/result.hpp>

#include <string>

namespace sidr {

class PageReader;

/**
 * LongValueResolver - Reassembles long values from a table's LV tree.
 *
 * Keys in the LV tree are the long-value id in big-endian order: four
 * bytes for the root entry (reference count and total size), eight bytes
 * (id followed by the big-endian byte offset) for each data segment.
 */
class LongValueResolver {
public:
    /**
     * @param reader Page source, must outlive the resolver
     * @param root Root page of the LV tree, INVALID_PAGE_NUMBER if the table has none
     */
    LongValueResolver(PageReader* reader, PageNumber root);

    /**
     * Concatenate all segments of a long value in offset order.
     *
     * @return The bytes, or DANGLING_LONG_VALUE when the tree holds no
     *         entry for the id; tree errors propagate
     */
    Result<std::string> resolve(LongValueId id) const;

    PageNumber root() const { return root_; }

private:
    PageReader* reader_;
    PageNumber root_;
};

}  // namespace sidr
