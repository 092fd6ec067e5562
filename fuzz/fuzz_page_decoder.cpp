#include "core/common.hpp"
#include "indexing/page_image.hpp"
#include "storage/format.hpp"
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

// Feeds arbitrary bytes to the page validator; pages it accepts must decode, re-encode
// and validate again without touching memory outside the page.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    if (size < arbor::storage::PAGE_HEADER_SIZE || size > arbor::core::PAGE_SIZE) {
        return 0;
    }

    std::vector<char> page(arbor::core::PAGE_SIZE, 0);
    std::memcpy(page.data(), data, size);

    auto hdr = arbor::storage::page_header(page.data());
    if (!arbor::storage::validate_page(page.data(), hdr.pgno).ok()) {
        return 0;
    }
    if (!(hdr.flags & (arbor::storage::PAGE_BRANCH | arbor::storage::PAGE_LEAF))) {
        return 0;
    }

    auto image = arbor::indexing::decode_image(page.data());
    for (size_t i = 0; i < arbor::storage::page_entries(hdr); i++) {
        auto node = arbor::storage::node_at(page.data(), i);
        if ((node.flags & (arbor::storage::NODE_SUBDB | arbor::storage::NODE_DUPTREE)) &&
            node.payload.size() == sizeof(arbor::storage::TreeRecord)) {
            (void)arbor::storage::decode_tree_record(node.payload);
        }
    }

    if (image.fits()) {
        std::vector<char> out(arbor::core::PAGE_SIZE, 0);
        arbor::indexing::encode_image(image, hdr.pgno, out.data());
        (void)arbor::storage::validate_page(out.data(), hdr.pgno);
    }
    return 0;
}
