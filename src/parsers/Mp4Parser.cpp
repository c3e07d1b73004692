#include "Parsers.h"
#include "ByteReader.h"
#include <cstring>
#include <functional>

namespace {
    struct BoxHeader {
        uint64_t offset;
        uint64_t size;      // whole box, header included
        uint32_t header;    // 8 or 16
        char type[4];
    };

    // Walks the boxes in [start, end). Returns false on the first box that
    // cannot fit (undersized, overlong or truncated large size) or when the
    // step cap runs out with bytes still left to walk.
    bool walk_boxes(const uint8_t* data, uint64_t start, uint64_t end, int& steps,
                    const std::function<void(const BoxHeader&)>& on_box) {
        uint64_t pos = start;
        while (pos + 8 <= end) {
            if (steps >= Mp4Parser::MAX_STEPS) return false;
            ++steps;

            BoxHeader box{};
            box.offset = pos;
            box.header = 8;
            uint64_t size = read_be32(data + pos);
            std::memcpy(box.type, data + pos + 4, 4);

            if (size == 1) {
                if (pos + 16 > end) return false;
                size = read_be64(data + pos + 8);
                box.header = 16;
                if (size < 16) return false;
            }
            else if (size == 0) {
                size = end - pos;
            }

            if (size < box.header || size > end - pos) return false;
            box.size = size;
            on_box(box);
            pos += size;
        }
        return true;
    }

    bool type_is(const BoxHeader& b, const char* t) {
        return std::memcmp(b.type, t, 4) == 0;
    }
}

ParseResult<Mp4Record> Mp4Parser::run(const std::string& path) const {
    MappedFile file(path);
    const uint8_t* data = file.data();
    const uint64_t n = file.size();
    if (n < 8) return ParseResult<Mp4Record>::failure("shorter than one box header", n);

    Mp4Record r;
    int steps = 0;
    bool moov_ok = true;

    bool top_ok = walk_boxes(data, 0, n, steps, [&](const BoxHeader& box) {
        if (type_is(box, "ftyp")) {
            if (box.size >= box.header + 4) {
                const uint8_t* brand = data + box.offset + box.header;
                r.brand.clear();
                for (int i = 0; i < 4; ++i)
                    if (brand[i] < 0x80) r.brand.push_back(static_cast<char>(brand[i]));
            }
            r.ftyp_present = true;
        }
        else if (type_is(box, "moov")) {
            r.moov_present = true;
            int child_steps = 0;
            if (!walk_boxes(data, box.offset + box.header, box.offset + box.size, child_steps,
                            [](const BoxHeader&) {}))
                moov_ok = false;
        }
        else if (type_is(box, "mdat")) {
            r.mdat_present = true;
        }
    });

    r.box_tree_ok = top_ok && moov_ok;
    r.parser_ok = r.ftyp_present && r.box_tree_ok && (r.moov_present || r.mdat_present);
    r.structure_consistent = r.ftyp_present && r.box_tree_ok && r.moov_present && r.mdat_present;
    return ParseResult<Mp4Record>::success(r);
}
