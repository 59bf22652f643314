#include "Chunk.hpp"

#include "Errors.hpp"

namespace railgun {
uint32_t checkedPayloadLength(const string& payload) {
  if (payload.length() > std::numeric_limits<uint32_t>::max()) {
    throw std::length_error("Chunk payload too large: " +
                            to_string(payload.length()));
  }
  return uint32_t(payload.length());
}

Chunk::Chunk(MessageKind _kind, const string& _payload)
    : header{_kind, checkedPayloadLength(_payload)}, payload(_payload) {}

Chunk::Chunk(const ChunkHeader& _header, const string& _payload)
    : header(_header), payload(_payload) {
  if (header.length != payload.length()) {
    STFATAL << "Chunk header length " << header.length
            << " does not match payload length " << payload.length();
  }
}

string Chunk::serialize() const {
  return encodeChunkHeader(header) + payload;
}

string encodeChunkHeader(const ChunkHeader& header) {
  string s(CHUNK_HEADER_SIZE, '\0');
  uint32_t networkLength = htonl(header.length);
  memcpy(&s[0], &networkLength, sizeof(uint32_t));
  s[4] = tagForKind(header.kind);
  return s;
}

string encodeChunk(MessageKind kind, const string& payload) {
  return Chunk(kind, payload).serialize();
}

ChunkHeader decodeChunkHeader(const string& bytes) {
  if (bytes.length() != CHUNK_HEADER_SIZE) {
    throw ProtocolDecodeError("Invalid chunk header size: " +
                              to_string(bytes.length()));
  }
  uint32_t networkLength;
  memcpy(&networkLength, bytes.data(), sizeof(uint32_t));
  ChunkHeader header;
  header.kind = kindForTag(bytes[4]);
  header.length = ntohl(networkLength);
  return header;
}
}  // namespace railgun
