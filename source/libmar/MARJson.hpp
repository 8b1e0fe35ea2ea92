#pragma once

#include <core/common.h>
#include <libmar/MAR.hpp>

#ifndef JS_STL_MAP
#define JS_STL_MAP
#endif
#include <json_struct/json_struct.h>

namespace libmar {

// Serializable mirror of `Archive`. Byte payloads are base64 text; keys follow
// the established MAR inspection format.

struct JSONSignaturesHeader {
  JS_OBJ(file_size, num_signatures);
  u64 file_size = 0;
  u32 num_signatures = 0;
};

struct JSONSignature {
  JS_OBJ(algorithm_id, size, algorithm, data);
  u32 algorithm_id = 0;
  u32 size = 0;
  std::string algorithm;
  std::string data;
};

struct JSONAdditionalSectionsHeader {
  JS_OBJ(num_additional_sections);
  u32 num_additional_sections = 0;
};

struct JSONAdditionalSection {
  JS_OBJ(block_size, block_id, data);
  u32 block_size = 0;
  u32 block_id = 0;
  std::string data;
};

struct JSONIndexHeader {
  JS_OBJ(size);
  u32 size = 0;
};

struct JSONIndexEntry {
  JS_OBJ(offset_to_content, size, flags, file_name);
  u32 offset_to_content = 0;
  u32 size = 0;
  u32 flags = 0;
  std::string file_name;
};

struct JSONEntry {
  JS_OBJ(data, is_compressed);
  std::string data;
  bool is_compressed = false;
};

struct JSONArchive {
  JS_OBJECT(JS_MEMBER(mar_id), JS_MEMBER(offset_to_index),
            JS_MEMBER(product_information),
            JS_MEMBER_WITH_NAME(signatures_header, "signature_header"),
            JS_MEMBER(signatures), JS_MEMBER(additional_sections_header),
            JS_MEMBER(additional_sections), JS_MEMBER(index_header),
            JS_MEMBER(index), JS_MEMBER(content));
  std::string mar_id;
  u32 offset_to_index = 0;
  std::string product_information;
  JSONSignaturesHeader signatures_header;
  std::vector<JSONSignature> signatures;
  JSONAdditionalSectionsHeader additional_sections_header;
  std::vector<JSONAdditionalSection> additional_sections;
  JSONIndexHeader index_header;
  std::vector<JSONIndexEntry> index;
  std::map<std::string, JSONEntry> content;

  static JSONArchive from(const Archive& arc);
};

//! RFC 4648 base64, standard alphabet, padded.
std::string EncodeBase64(rsl::byte_view data);

//! JSON rendering of every parsed field, for inspection tooling.
std::string SerializeArchive(const Archive& arc, bool pretty = true);

} // namespace libmar
