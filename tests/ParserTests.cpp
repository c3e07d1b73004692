#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <random>
#include <string>

#include "Parsers.h"
#include "ParserRegistry.h"
#include "ByteReader.h"
#include "CompoundFile.h"
#include "ZipDirectory.h"
#include "Signatures.h"
#include "TestSupport.h"

namespace {
    void poke32(std::string& s, size_t off, uint32_t v) {
        for (int i = 0; i < 4; ++i) s[off + i] = static_cast<char>((v >> (8 * i)) & 0xFF);
    }

    void poke32be(std::string& s, size_t off, uint32_t v) {
        for (int i = 0; i < 4; ++i) s[off + i] = static_cast<char>((v >> (8 * (3 - i))) & 0xFF);
    }
}

class ParserTest : public ::testing::Test {
protected:
    TempDir dir;
    SampleGenerator gen;
};

// ==========================================
// REGISTRY
// ==========================================

TEST(ParserRegistryTest, Families) {
    EXPECT_EQ(ParserRegistry::structural().families(),
              (std::vector<std::string>{"gzip", "jpeg", "mp4", "ole2", "ooxml", "pdf", "png", "rar", "zip"}));
    EXPECT_EQ(ParserRegistry::encryption().families(),
              (std::vector<std::string>{"ole2_enc", "pdf_enc", "zip_enc"}));
    EXPECT_EQ(ParserRegistry::structural().get("other"), nullptr);
    EXPECT_EQ(ParserRegistry::encryption().get("ooxml_enc"), nullptr);
    ASSERT_NE(ParserRegistry::structural().get("pdf"), nullptr);
    EXPECT_EQ(ParserRegistry::structural().get("pdf")->family(), "pdf");
}

TEST_F(ParserTest, Every_Parser_Returns_Default_Record_On_Empty_File) {
    const std::string empty = dir.write("empty", "");
    for (const auto* reg : {&ParserRegistry::structural(), &ParserRegistry::encryption()}) {
        for (const std::string& family : reg->families()) {
            const FormatParser* p = reg->get(family);
            FeatureMap got = p->parse(empty);
            FeatureMap def = p->default_record();
            ASSERT_EQ(got.keys(), def.keys()) << family;
            for (const auto& [k, v] : def) EXPECT_EQ(*got.find(k), v) << family << "." << k;
            if (got.contains("parser_ok")) EXPECT_EQ(get_bool(got, "parser_ok"), false) << family;
        }
    }
}

TEST_F(ParserTest, Missing_File_Gives_Default_Record) {
    const std::string missing = (dir.path() / "gone.bin").string();
    for (const std::string& family : ParserRegistry::structural().families()) {
        FeatureMap got = ParserRegistry::structural().get(family)->parse(missing);
        EXPECT_EQ(get_bool(got, "parser_ok"), false) << family;
    }
}

// ==========================================
// GZIP
// ==========================================

TEST_F(ParserTest, Gzip_Minimal_Header) {
    GzipRecord r = GzipParser().parse_record(
        dir.write("a.gz", std::string("\x1F\x8B\x08\x00\x00\x00\x00\x00\x00\x03", 10)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_FALSE(r.mtime_present);
    EXPECT_FALSE(r.name_present);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Gzip_Name_And_Mtime) {
    GzipRecord r = GzipParser().parse_record(dir.write("b.gz", gen.gzip(true, 1700000000u)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.mtime_present);
    EXPECT_TRUE(r.name_present);
}

TEST_F(ParserTest, Gzip_Unterminated_Name) {
    std::string bytes("\x1F\x8B\x08\x08\x00\x00\x00\x00\x00\x03", 10);
    bytes += "no-terminator";
    GzipRecord r = GzipParser().parse_record(dir.write("c.gz", bytes));
    EXPECT_TRUE(r.parser_ok);
    EXPECT_FALSE(r.name_present);
}

TEST_F(ParserTest, Gzip_Truncated_Extra_Keeps_Base_Header) {
    std::string bytes("\x1F\x8B\x08\x04\x01\x00\x00\x00\x00\x03\xFF", 11);
    GzipRecord r = GzipParser().parse_record(dir.write("d.gz", bytes));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.mtime_present);
    EXPECT_TRUE(r.parser_ok);
}

TEST(GzipHeader, Optional_Fields_End_Offset) {
    // FEXTRA(2) + FNAME + FCOMMENT + FHCRC
    std::string bytes("\x1F\x8B\x08\x1E\x00\x00\x00\x00\x00\x03", 10);
    bytes += std::string("\x02\x00xy", 4);
    bytes += std::string("n.txt\0", 6);
    bytes += std::string("c\0", 2);
    bytes += std::string("\xAB\xCD", 2);
    bool name = false;
    EXPECT_EQ(GzipParser::header_end(as_bytes(bytes), bytes.size(), name), std::optional<size_t>(24));
    EXPECT_TRUE(name);

    EXPECT_FALSE(GzipParser::header_end(as_bytes(bytes), bytes.size() - 1, name).has_value());
    EXPECT_TRUE(name);
}

TEST(GzipHeader, Header_Crc_Only) {
    const std::string bytes("\x1F\x8B\x08\x02\x00\x00\x00\x00\x00\x03\x12\x34", 12);
    bool name = true;
    EXPECT_EQ(GzipParser::header_end(as_bytes(bytes), bytes.size(), name), std::optional<size_t>(12));
    EXPECT_FALSE(name);
    EXPECT_FALSE(GzipParser::header_end(as_bytes(bytes), 11, name).has_value());
}

TEST_F(ParserTest, Gzip_Truncated_Header_Crc_Keeps_Base_Header) {
    GzipRecord r = GzipParser().parse_record(
        dir.write("hcrc.gz", std::string("\x1F\x8B\x08\x02\x00\x00\x00\x00\x00\x03", 10)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Gzip_Wrong_Method) {
    GzipRecord r = GzipParser().parse_record(
        dir.write("e.gz", std::string("\x1F\x8B\x07\x00\x00\x00\x00\x00\x00\x03", 10)));
    EXPECT_FALSE(r.header_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Gzip_Too_Short) {
    GzipRecord r = GzipParser().parse_record(dir.write("f.gz", "\x1F\x8B\x08"));
    EXPECT_FALSE(r.parser_ok);
    EXPECT_FALSE(r.header_ok);
}

// ==========================================
// JPEG
// ==========================================

TEST_F(ParserTest, Jpeg_With_Exif) {
    JpegRecord r = JpegParser().parse_record(dir.write("a.jpg", gen.jpeg(true)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.sof_present);
    EXPECT_TRUE(r.sos_present);
    EXPECT_TRUE(r.exif_present);
    EXPECT_EQ(r.segments_count, 6);  // APP0 APP1 DQT SOF0 DHT SOS
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Jpeg_Without_Exif) {
    JpegRecord r = JpegParser().parse_record(dir.write("b.jpg", gen.jpeg(false)));
    EXPECT_FALSE(r.exif_present);
    EXPECT_EQ(r.segments_count, 5);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Jpeg_Standalone_Markers_Count) {
    // RST0, TEM and EOI carry no length field
    JpegRecord r = JpegParser().parse_record(dir.write("c.jpg", std::string("\xFF\xD8\xFF\xD0\xFF\x01\xFF\xD9", 8)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_EQ(r.segments_count, 3);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Jpeg_Segment_Past_End_Stops) {
    std::string bytes = gen.jpeg(false).substr(0, 30);
    JpegRecord r = JpegParser().parse_record(dir.write("d.jpg", bytes));
    EXPECT_TRUE(r.header_ok);
    EXPECT_FALSE(r.sos_present);
    EXPECT_FALSE(r.structure_consistent);
}

TEST_F(ParserTest, Jpeg_Missing_Soi) {
    JpegRecord r = JpegParser().parse_record(dir.write("e.jpg", "\xFF\xE0\x00\x10"));
    EXPECT_FALSE(r.header_ok);
    EXPECT_FALSE(r.parser_ok);
}

// ==========================================
// PNG
// ==========================================

TEST_F(ParserTest, Png_Minimal) {
    std::string bytes = Sig::Bin::PNG;
    bytes += std::string("\x00\x00\x00\x0DIHDR", 8) + std::string(13, '\0') + std::string(4, '\0');
    bytes += std::string("\x00\x00\x00\x00IDAT", 8) + std::string(4, '\0');
    bytes += std::string("\x00\x00\x00\x00IEND", 8) + std::string(4, '\0');
    PngRecord r = PngParser().parse_record(dir.write("a.png", bytes));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.ihdr_ok);
    EXPECT_EQ(r.chunks_count, 3);
    EXPECT_EQ(r.idat_count, 1);
    EXPECT_TRUE(r.end_iend_ok);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Png_Generated) {
    PngRecord r = PngParser().parse_record(dir.write("b.png", gen.png()));
    EXPECT_EQ(r.chunks_count, 3);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Png_Wrong_First_Chunk) {
    std::string bytes = gen.png();
    std::memcpy(&bytes[12], "tEXt", 4);
    PngRecord r = PngParser().parse_record(dir.write("c.png", bytes));
    EXPECT_TRUE(r.header_ok);
    EXPECT_FALSE(r.ihdr_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Png_Oversized_Chunk_Stops_Walk) {
    std::string bytes = gen.png();
    poke32be(bytes, 8 + 25, 0x7FFFFFF0);  // IDAT length
    PngRecord r = PngParser().parse_record(dir.write("d.png", bytes));
    EXPECT_TRUE(r.ihdr_ok);
    EXPECT_EQ(r.chunks_count, 1);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Png_Signature_Only) {
    PngRecord r = PngParser().parse_record(dir.write("e.png", Sig::Bin::PNG));
    EXPECT_FALSE(r.header_ok);
    EXPECT_FALSE(r.parser_ok);
}

// ==========================================
// MP4
// ==========================================

TEST_F(ParserTest, Mp4_Generated) {
    Mp4Record r = Mp4Parser().parse_record(dir.write("a.mp4", gen.mp4("isom")));
    EXPECT_TRUE(r.ftyp_present);
    EXPECT_TRUE(r.moov_present);
    EXPECT_TRUE(r.mdat_present);
    EXPECT_EQ(r.brand, "isom");
    EXPECT_TRUE(r.box_tree_ok);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Mp4_Brand_Keeps_Ascii_Only) {
    Mp4Record r = Mp4Parser().parse_record(dir.write("b.mp4", gen.mp4("q\xC3t ")));
    EXPECT_EQ(r.brand, "qt ");
}

TEST_F(ParserTest, Mp4_Last_Ftyp_Sets_Brand) {
    std::string bytes = gen.mp4("isom");
    const size_t off = bytes.size();
    bytes += std::string("\0\0\0\0ftypmp42\0\0\0\0", 16);
    poke32be(bytes, off, 16);
    Mp4Record r = Mp4Parser().parse_record(dir.write("two_ftyp.mp4", bytes));
    EXPECT_TRUE(r.ftyp_present);
    EXPECT_EQ(r.brand, "mp42");
}

TEST_F(ParserTest, Mp4_Undersized_Box_Rejected) {
    std::string bytes = gen.mp4();
    poke32be(bytes, 24, 4);  // moov size below its header
    Mp4Record r = Mp4Parser().parse_record(dir.write("c.mp4", bytes));
    EXPECT_TRUE(r.ftyp_present);
    EXPECT_FALSE(r.moov_present);
    EXPECT_FALSE(r.box_tree_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Mp4_Child_Overrunning_Moov) {
    std::string bytes = gen.mp4();
    poke32be(bytes, 32, 0x1000);  // mvhd claims more than moov holds
    Mp4Record r = Mp4Parser().parse_record(dir.write("d.mp4", bytes));
    EXPECT_TRUE(r.moov_present);
    EXPECT_TRUE(r.mdat_present);
    EXPECT_FALSE(r.box_tree_ok);
    EXPECT_FALSE(r.structure_consistent);
}

TEST_F(ParserTest, Mp4_Size_Zero_Extends_To_End) {
    std::string bytes = gen.mp4();
    const size_t mdat = bytes.size() - 72;
    poke32be(bytes, mdat, 0);
    Mp4Record r = Mp4Parser().parse_record(dir.write("e.mp4", bytes));
    EXPECT_TRUE(r.mdat_present);
    EXPECT_TRUE(r.box_tree_ok);
}

TEST_F(ParserTest, Mp4_Large_Size_Field) {
    std::string bytes("\x00\x00\x00\x01" "ftyp" "\x00\x00\x00\x00\x00\x00\x00\x18" "isom" "\x00\x00\x02\x00", 24);
    Mp4Record r = Mp4Parser().parse_record(dir.write("f.mp4", bytes));
    EXPECT_TRUE(r.ftyp_present);
    EXPECT_EQ(r.brand, "isom");
    EXPECT_TRUE(r.box_tree_ok);
    EXPECT_FALSE(r.parser_ok);  // neither moov nor mdat
}

TEST_F(ParserTest, Mp4_Random_Box_Sizes_Stay_In_Bounds) {
    std::mt19937 rng(20240611);
    std::uniform_int_distribution<uint32_t> any;
    const std::string base = gen.mp4();
    for (int i = 0; i < 300; ++i) {
        std::string bytes = base;
        for (size_t off : {0u, 24u, 32u, 140u, 148u}) {
            if (off + 4 <= bytes.size() && (rng() & 1)) poke32be(bytes, off, any(rng) % 512);
        }
        Mp4Record r = Mp4Parser().parse_record(dir.write("fuzz.mp4", bytes));
        if (r.parser_ok) EXPECT_TRUE(r.box_tree_ok);
        if (r.structure_consistent) EXPECT_TRUE(r.moov_present && r.mdat_present);
    }
}

// ==========================================
// OLE2
// ==========================================

TEST_F(ParserTest, Ole2_Generated_Document) {
    Ole2Record r = Ole2Parser().parse_record(dir.write("a.doc", gen.cfb()));
    EXPECT_TRUE(r.dir_ok);
    EXPECT_TRUE(r.fat_ok);
    EXPECT_TRUE(r.mini_fat_ok);
    EXPECT_TRUE(r.root_entry_present);
    EXPECT_TRUE(r.summaryinfo_present);
    EXPECT_TRUE(r.expected_streams_present);
    EXPECT_EQ(r.stream_count, 2);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Ole2_Streams_Readable_Through_Mini_Stream) {
    const std::string bytes = gen.cfb();
    const auto* data = reinterpret_cast<const uint8_t*>(bytes.data());
    ParseResult<CompoundFile> cf = CompoundFile::open(data, bytes.size());
    ASSERT_TRUE(cf.ok());
    CfbDirectory dir_entries = cf.value().directory();
    ASSERT_TRUE(dir_entries.ok);

    bool saw_summary = false, saw_word = false;
    for (const auto& e : dir_entries.entries) {
        if (e.name == Sig::Bin::OLE_SUMMARY) {
            saw_summary = true;
            std::string s = cf.value().read_stream(e, 1000);
            ASSERT_EQ(s.size(), 200u);
            EXPECT_EQ(s.substr(0, 3), "abc");
        }
        if (e.name == Sig::Bin::OLE_WORD) {
            saw_word = true;
            std::string s = cf.value().read_stream(e, 10);
            EXPECT_EQ(s, "ABCDEFGHIJ");
        }
    }
    EXPECT_TRUE(saw_summary);
    EXPECT_TRUE(saw_word);
}

TEST_F(ParserTest, Ole2_Directory_Chain_Cycle_Terminates) {
    std::string bytes = gen.cfb();
    // sector 0 is the FAT; its entry for the directory sector (1) points back to 1
    poke32(bytes, 512 + 1 * 4, 1);
    Ole2Record r = Ole2Parser().parse_record(dir.write("cycle.doc", bytes));
    EXPECT_TRUE(r.fat_ok);
    EXPECT_TRUE(r.dir_ok);
    EXPECT_TRUE(r.root_entry_present);
}

TEST_F(ParserTest, Ole2_Difat_Cycle_Terminates) {
    std::string bytes = gen.cfb();
    // sector 3 holds the mini stream; its last word becomes a DIFAT link to itself
    const uint32_t self = 3;
    poke32(bytes, 0x44, self);
    poke32(bytes, 0x48, 1000000);
    poke32(bytes, 512 + self * 512 + 508, self);
    Ole2Record r = Ole2Parser().parse_record(dir.write("difat.doc", bytes));
    EXPECT_FALSE(r.fat_ok);  // the mini stream text is not a list of FAT sectors
    EXPECT_TRUE(r.root_entry_present);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Ole2_Repeated_Fat_Sectors_Accepted) {
    std::string bytes = gen.cfb();
    // more header DIFAT slots than the image has sectors, all naming FAT sector 0
    for (uint32_t k = 1; k < 40; ++k) poke32(bytes, 0x4C + k * 4, 0);
    ASSERT_LT(bytes.size() / 512 + 1, 40u);
    Ole2Record r = Ole2Parser().parse_record(dir.write("manyfat.doc", bytes));
    EXPECT_TRUE(r.fat_ok);
    EXPECT_TRUE(r.dir_ok);
    EXPECT_TRUE(r.root_entry_present);
}

TEST_F(ParserTest, Ole2_Bad_Object_Type) {
    std::string bytes = gen.cfb();
    bytes[512 + 512 + 128 + 0x42] = 7;  // second directory entry
    Ole2Record r = Ole2Parser().parse_record(dir.write("bad.doc", bytes));
    EXPECT_FALSE(r.dir_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Ole2_Truncated_Header) {
    Ole2Record r = Ole2Parser().parse_record(dir.write("short.doc", gen.cfb().substr(0, 100)));
    EXPECT_FALSE(r.parser_ok);
    EXPECT_FALSE(r.root_entry_present);
}

// ==========================================
// ZIP
// ==========================================

TEST_F(ParserTest, Zip_Generated) {
    std::string bytes = gen.zip({ { "a.txt", "alpha" }, { "b.txt", "beta", false, false, true } }, "hi");
    ZipRecord r = ZipParser().parse_record(dir.write("a.zip", bytes));
    EXPECT_TRUE(r.central_dir_ok);
    EXPECT_TRUE(r.cd_offset_ok);
    EXPECT_EQ(r.entry_count, 2);
    EXPECT_FALSE(r.has_content_types);
    EXPECT_EQ(r.comment_len, 2);
    EXPECT_DOUBLE_EQ(r.names_utf8_fraction, 0.5);
    EXPECT_DOUBLE_EQ(r.crc_present_fraction, 1.0);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Zip_Fractions_Rounded) {
    std::string bytes = gen.zip({ { "a", "1" }, { "b", "2", false, false, true }, { "c", "3" } });
    ZipRecord r = ZipParser().parse_record(dir.write("b.zip", bytes));
    EXPECT_DOUBLE_EQ(r.names_utf8_fraction, 0.333333);
}

TEST_F(ParserTest, Zip_No_Eocd) {
    std::string bytes = gen.zip({ { "a.txt", "alpha" } });
    bytes.resize(bytes.size() - 22);
    ZipRecord r = ZipParser().parse_record(dir.write("c.zip", bytes));
    EXPECT_FALSE(r.central_dir_ok);
    EXPECT_EQ(r.entry_count, 0);
    EXPECT_FALSE(r.parser_ok);
    EXPECT_FALSE(r.structure_consistent);
}

TEST_F(ParserTest, Zip_Empty_Archive) {
    std::string bytes = gen.zip({});
    ZipRecord r = ZipParser().parse_record(dir.write("d.zip", bytes));
    EXPECT_TRUE(r.central_dir_ok);
    EXPECT_EQ(r.entry_count, 0);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Zip_Cd_Offset_Out_Of_Range) {
    std::string bytes = gen.zip({ { "a.txt", "alpha" } });
    poke32(bytes, bytes.size() - 6, 0x00FFFFFF);
    ZipRecord r = ZipParser().parse_record(dir.write("e.zip", bytes));
    EXPECT_FALSE(r.parser_ok);
    EXPECT_FALSE(r.cd_offset_ok);
}

TEST_F(ParserTest, Zip_Entry_Count_Mismatch) {
    std::string bytes = gen.zip({ { "a.txt", "alpha" } });
    bytes[bytes.size() - 12] = 2;  // entries_total
    ZipRecord r = ZipParser().parse_record(dir.write("f.zip", bytes));
    EXPECT_EQ(r.entry_count, 1);
    EXPECT_FALSE(r.central_dir_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST(ZipDirectoryTest, Eocd_Found_Behind_Comment) {
    SampleGenerator gen;
    const std::string bytes = gen.zip({ { "a", "x" } }, std::string(300, 'c'));
    auto eocd = ZipDirectory::find_eocd(reinterpret_cast<const uint8_t*>(bytes.data()), bytes.size());
    ASSERT_TRUE(eocd.has_value());
    const uint16_t comment_length = eocd->record.comment_length;
    const uint16_t entries_total = eocd->record.entries_total;
    EXPECT_EQ(eocd->position, bytes.size() - 22 - 300);
    EXPECT_EQ(comment_length, 300);
    EXPECT_EQ(entries_total, 1);
}

// ==========================================
// OOXML
// ==========================================

TEST_F(ParserTest, Ooxml_Generated) {
    OoxmlRecord r = OoxmlParser().parse_record(dir.write("a.docx", gen.ooxml()));
    EXPECT_TRUE(r.detected);
    EXPECT_TRUE(r.coreparts_present);
    EXPECT_EQ(r.rel_count, 2);
    EXPECT_TRUE(r.pkg_ok);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Ooxml_Relationship_Count_Stops_Early) {
    std::vector<ZipSampleEntry> entries = {
        { "[Content_Types].xml", "<Types xmlns=\"x\"></Types>" },
        { "xl/workbook.xml", "<workbook/>" },
    };
    for (int i = 0; i < 30; ++i) entries.push_back({ "xl/_rels/r" + std::to_string(i) + ".rels", "<Relationships/>" });
    OoxmlRecord r = OoxmlParser().parse_record(dir.write("b.xlsx", gen.zip(entries)));
    EXPECT_EQ(r.rel_count, 21);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Ooxml_Without_Types_Element) {
    std::vector<ZipSampleEntry> entries = {
        { "[Content_Types].xml", "<NotTypes/>" },
        { "word/document.xml", "<document/>" },
        { "_rels/.rels", "<Relationships/>" },
    };
    OoxmlRecord r = OoxmlParser().parse_record(dir.write("c.docx", gen.zip(entries)));
    EXPECT_TRUE(r.detected);
    EXPECT_FALSE(r.pkg_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Ooxml_Plain_Zip_Not_Detected) {
    OoxmlRecord r = OoxmlParser().parse_record(dir.write("d.zip", gen.zip({ { "a.txt", "x" } })));
    EXPECT_FALSE(r.detected);
    EXPECT_FALSE(r.pkg_ok);
    EXPECT_FALSE(r.parser_ok);
}

// ==========================================
// RAR
// ==========================================

TEST_F(ParserTest, Rar4_Generated) {
    RarRecord r = RarParser().parse_record(dir.write("a.rar", gen.rar4(3)));
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.main_header_flags_ok);
    EXPECT_EQ(r.file_records_count, 3);
    EXPECT_FALSE(r.version_5);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Rar4_Main_Only) {
    RarRecord r = RarParser().parse_record(dir.write("b.rar", gen.rar4(0)));
    EXPECT_TRUE(r.parser_ok);
    EXPECT_EQ(r.file_records_count, 0);
    EXPECT_FALSE(r.structure_consistent);
}

TEST_F(ParserTest, Rar4_Add_Size_Added_On_Top_Of_Head_Size) {
    // MAIN, then a block whose head_size (7) does not cover its ADD_SIZE
    // field: the walk still moves 7 + add_size bytes, landing on the FILE
    // block right after the 4-byte field.
    std::string bytes = Sig::Bin::RAR4;
    bytes += std::string("\x00\x00\x73\x00\x00\x0D\x00", 7) + std::string(6, '\0');
    bytes += std::string("\x00\x00\x7A\x00\x80\x07\x00", 7) + std::string("\x04\x00\x00\x00", 4);
    bytes += std::string("\x00\x00\x74\x00\x00\x07\x00", 7);
    bytes += std::string("\x00\x00\x7B\x00\x40\x07\x00", 7);
    RarRecord r = RarParser().parse_record(dir.write("quirk.rar", bytes));
    EXPECT_TRUE(r.header_ok);
    EXPECT_EQ(r.file_records_count, 1);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Rar4_Block_Past_End) {
    std::string bytes = gen.rar4(1);
    bytes.resize(bytes.size() - 20);  // cut into the FILE data
    RarRecord r = RarParser().parse_record(dir.write("c.rar", bytes));
    EXPECT_TRUE(r.parser_ok);
    EXPECT_EQ(r.file_records_count, 0);
}

TEST_F(ParserTest, Rar5_Generated) {
    RarRecord r = RarParser().parse_record(dir.write("d.rar", gen.rar5()));
    EXPECT_TRUE(r.version_5);
    EXPECT_TRUE(r.header_ok);
    EXPECT_TRUE(r.main_header_flags_ok);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Rar5_Signature_Only) {
    RarRecord r = RarParser().parse_record(dir.write("e.rar", Sig::Bin::RAR5));
    EXPECT_TRUE(r.parser_ok);
    EXPECT_FALSE(r.structure_consistent);
}

TEST_F(ParserTest, Rar_Not_A_Rar) {
    RarRecord r = RarParser().parse_record(dir.write("f.rar", "Rar?\x1A\x07\x00 nope"));
    EXPECT_FALSE(r.parser_ok);
    EXPECT_FALSE(r.header_ok);
}

// ==========================================
// PDF
// ==========================================

TEST_F(ParserTest, Pdf_Classic) {
    PdfRecord r = PdfParser().parse_record(dir.write("a.pdf", gen.pdf()));
    ASSERT_TRUE(r.version.has_value());
    EXPECT_DOUBLE_EQ(*r.version, 1.7);
    EXPECT_TRUE(r.has_trailer);
    EXPECT_TRUE(r.startxref_found);
    EXPECT_TRUE(r.xref_ok);
    EXPECT_TRUE(r.ids_present);
    EXPECT_TRUE(r.root_present);
    EXPECT_TRUE(r.trailer_ok);
    EXPECT_GT(r.obj_count_est, 0.0);
    EXPECT_TRUE(r.parser_ok);
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Pdf_Xref_Stream_Uses_Declared_Size) {
    PdfSampleOptions opt;
    opt.xref_stream = true;
    opt.with_id = false;
    PdfRecord r = PdfParser().parse_record(dir.write("b.pdf", gen.pdf(opt)));
    EXPECT_FALSE(r.has_trailer);
    EXPECT_TRUE(r.xref_ok);
    EXPECT_TRUE(r.trailer_ok);
    EXPECT_FALSE(r.ids_present);
    EXPECT_DOUBLE_EQ(r.obj_count_est, std::log1p(5.0));  // /Size 5
    EXPECT_TRUE(r.structure_consistent);
}

TEST_F(ParserTest, Pdf_Without_Startxref_Counts_Objects) {
    const std::string bytes = "%PDF-1.4\n1 0 obj\n<<>>\nendobj\n2 0 obj\n<<>>\nendobj\n";
    PdfRecord r = PdfParser().parse_record(dir.write("c.pdf", bytes));
    EXPECT_FALSE(r.startxref_found);
    EXPECT_FALSE(r.parser_ok);
    EXPECT_DOUBLE_EQ(r.obj_count_est, std::log1p(2.0));
}

TEST_F(ParserTest, Pdf_Version_Variants) {
    PdfSampleOptions opt;
    opt.version = "2.0";
    EXPECT_DOUBLE_EQ(*PdfParser().parse_record(dir.write("d.pdf", gen.pdf(opt))).version, 2.0);
    EXPECT_FALSE(PdfParser().parse_record(dir.write("e.pdf", "%PDF-x.y\n")).version.has_value());
    EXPECT_FALSE(PdfParser().parse_record(dir.write("f.pdf", "%PDF-0\n")).version.has_value());
}

TEST_F(ParserTest, Pdf_Startxref_Offset_Past_End) {
    const std::string bytes = "%PDF-1.4\ntrailer\n<< /Root 1 0 R >>\nstartxref\n999999\n%%EOF\n";
    PdfRecord r = PdfParser().parse_record(dir.write("g.pdf", bytes));
    EXPECT_TRUE(r.startxref_found);
    EXPECT_FALSE(r.xref_ok);
    EXPECT_FALSE(r.has_trailer);
    EXPECT_FALSE(r.trailer_ok);
    EXPECT_FALSE(r.parser_ok);
}

TEST_F(ParserTest, Pdf_Huge_Startxref_Offset_Is_Ignored) {
    const std::string bytes = "%PDF-1.4\nstartxref\n123456789012345678901234\n%%EOF\n";
    PdfRecord r = PdfParser().parse_record(dir.write("h.pdf", bytes));
    EXPECT_TRUE(r.startxref_found);
    EXPECT_FALSE(r.xref_ok);
}
