#include "storage/format.hpp"
#include "core/common.hpp"
#include "core/status.hpp"
#include "storage/checksum.hpp"
#include <fmt/core.h>

namespace arbor::storage {

    auto validate_page(const char *page, core::PageId expected) -> core::Status {
        auto hdr = page_header(page);
        if (hdr.pgno != expected) {
            return core::Status::Corruption(
                fmt::format("page {} carries page number {}", expected, hdr.pgno));
        }

        const uint16_t kind = hdr.flags & (PAGE_BRANCH | PAGE_LEAF | PAGE_OVERFLOW);
        if (kind != PAGE_BRANCH && kind != PAGE_LEAF && kind != PAGE_OVERFLOW) {
            return core::Status::Corruption(
                fmt::format("page {} has invalid flags {:#x}", expected, hdr.flags));
        }
        if (kind == PAGE_OVERFLOW) {
            if (hdr.overflow_pages == 0) {
                return core::Status::Corruption(
                    fmt::format("overflow page {} has an empty run", expected));
            }
            return core::Status::Ok();
        }

        if (hdr.lower < PAGE_HEADER_SIZE || hdr.lower > hdr.upper || hdr.upper > core::PAGE_SIZE ||
            (hdr.lower - PAGE_HEADER_SIZE) % SLOT_SIZE != 0) {
            return core::Status::Corruption(fmt::format(
                "page {} has bad bounds lower={} upper={}", expected, hdr.lower, hdr.upper));
        }

        size_t n = page_entries(hdr);
        if (kind == PAGE_BRANCH && n < 2) {
            return core::Status::Corruption(
                fmt::format("branch page {} has {} children", expected, n));
        }

        for (size_t i = 0; i < n; i++) {
            auto offset = load<uint16_t>(page + PAGE_HEADER_SIZE + i * SLOT_SIZE);
            if (offset < hdr.upper || offset + NODE_HEADER_SIZE > core::PAGE_SIZE) {
                return core::Status::Corruption(
                    fmt::format("page {} slot {} points outside node area", expected, i));
            }
            auto node = load<NodeHeader>(page + offset);
            size_t payload = (kind == PAGE_BRANCH || (node.flags & NODE_BIGDATA))
                                 ? sizeof(core::PageId)
                                 : node.dsize;
            if (offset + NODE_HEADER_SIZE + node.ksize + payload > core::PAGE_SIZE) {
                return core::Status::Corruption(
                    fmt::format("page {} node {} overruns the page", expected, i));
            }
            if ((node.flags & (NODE_SUBDB | NODE_DUPTREE)) &&
                (node.dsize != sizeof(TreeRecord) || (node.flags & NODE_BIGDATA))) {
                return core::Status::Corruption(
                    fmt::format("page {} node {} has a malformed tree record", expected, i));
            }
        }
        return core::Status::Ok();
    }

    auto meta_checksum(const MetaRecord &meta) -> uint32_t {
        return compute_crc32(&meta, META_CHECKSUM_OFFSET);
    }

    auto validate_meta(const MetaRecord &meta) -> core::Status {
        if (meta.magic != META_MAGIC) {
            return core::Status::Corruption(fmt::format("bad meta magic {:#x}", meta.magic));
        }
        if (meta.version != FORMAT_VERSION) {
            return core::Status::Incompatible(
                fmt::format("unsupported format version {}", meta.version));
        }
        if (meta.page_size != core::PAGE_SIZE) {
            return core::Status::Incompatible(
                fmt::format("page size {} differs from {}", meta.page_size, core::PAGE_SIZE));
        }
        if (meta.checksum != meta_checksum(meta)) {
            return core::Status::Corruption(
                fmt::format("meta checksum mismatch for txn {}", meta.txnid));
        }
        return core::Status::Ok();
    }

} // namespace arbor::storage
