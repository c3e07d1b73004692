#include "Parsers.h"

FeatureMap GzipRecord::to_features() const {
    FeatureMap m;
    m.set("gzip_header_ok", header_ok);
    m.set("gzip_mtime_present", mtime_present);
    m.set("gzip_name_present", name_present);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap JpegRecord::to_features() const {
    FeatureMap m;
    m.set("jpeg_header_ok", header_ok);
    m.set("jpeg_sof_present", sof_present);
    m.set("jpeg_sos_present", sos_present);
    m.set("jpeg_exif_present", exif_present);
    m.set("jpeg_segments_count", segments_count);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap PngRecord::to_features() const {
    FeatureMap m;
    m.set("png_header_ok", header_ok);
    m.set("png_ihdr_ok", ihdr_ok);
    m.set("png_chunks_count", chunks_count);
    m.set("png_idat_count", idat_count);
    m.set("png_end_iend_ok", end_iend_ok);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap Mp4Record::to_features() const {
    FeatureMap m;
    m.set("mp4_ftyp_present", ftyp_present);
    m.set("mp4_moov_present", moov_present);
    m.set("mp4_mdat_present", mdat_present);
    m.set("mp4_brand", brand);
    m.set("mp4_box_tree_ok", box_tree_ok);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap Ole2Record::to_features() const {
    FeatureMap m;
    m.set("ole_dir_ok", dir_ok);
    m.set("ole_stream_count", stream_count);
    m.set("ole_fat_ok", fat_ok);
    m.set("ole_mini_fat_ok", mini_fat_ok);
    m.set("ole_root_entry_present", root_entry_present);
    m.set("ole_summaryinfo_present", summaryinfo_present);
    m.set("ole_expected_streams_present", expected_streams_present);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap ZipRecord::to_features() const {
    FeatureMap m;
    m.set("zip_central_dir_ok", central_dir_ok);
    m.set("zip_cd_offset_ok", cd_offset_ok);
    m.set("zip_entry_count", entry_count);
    m.set("zip_has_content_types", has_content_types);
    m.set("zip_comment_len", comment_len);
    m.set("zip_names_utf8_fraction", names_utf8_fraction);
    m.set("zip_crc_present_fraction", crc_present_fraction);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap OoxmlRecord::to_features() const {
    FeatureMap m;
    m.set("ooxml_detected", detected);
    m.set("ooxml_coreparts_present", coreparts_present);
    m.set("ooxml_rel_count", rel_count);
    m.set("ooxml_pkg_ok", pkg_ok);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap RarRecord::to_features() const {
    FeatureMap m;
    m.set("rar_header_ok", header_ok);
    m.set("rar_main_header_flags_ok", main_header_flags_ok);
    m.set("rar_file_records_count", file_records_count);
    m.set("rar_version_5", version_5);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap PdfRecord::to_features() const {
    FeatureMap m;
    m.set("pdf_version", optional_value(version));
    m.set("pdf_has_trailer", has_trailer);
    m.set("pdf_startxref_found", startxref_found);
    m.set("pdf_xref_ok", xref_ok);
    m.set("pdf_ids_present", ids_present);
    m.set("pdf_root_present", root_present);
    m.set("pdf_trailer_ok", trailer_ok);
    m.set("pdf_obj_count_est", obj_count_est);
    m.set("parser_ok", parser_ok);
    m.set("structure_consistent", structure_consistent);
    return m;
}

FeatureMap Ole2EncRecord::to_features() const {
    FeatureMap m;
    m.set("encrypted_package_present", encrypted_package_present);
    m.set("ooxml_encryption_info_present", encryption_info_present);
    m.set("ooxml_encryption_type", optional_value(encryption_type));
    m.set("ole_crypto_provider", optional_value(crypto_provider));
    m.set("ole_rc4_meta_present", rc4_meta_present);
    m.set("ole_rc4_triplet_present", rc4_triplet_present);
    return m;
}

FeatureMap PdfEncRecord::to_features() const {
    FeatureMap m;
    m.set("pdf_encrypt_dict_present", encrypt_dict_present);
    m.set("pdf_encrypt_filter", optional_value(filter));
    m.set("pdf_encrypt_metadata", optional_value(encrypt_metadata));
    return m;
}

FeatureMap ZipEncRecord::to_features() const {
    FeatureMap m;
    m.set("zip_any_entry_encrypted", any_entry_encrypted);
    m.set("zip_encryption_method", optional_value(method));
    m.set("zip_all_headers_encrypted", all_headers_encrypted);
    return m;
}
