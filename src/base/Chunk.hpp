#ifndef __RAILGUN_CHUNK__
#define __RAILGUN_CHUNK__

#include "Headers.hpp"
#include "MessageKind.hpp"

namespace railgun {
/** @brief Size of a serialized chunk header: 4 length bytes + 1 tag byte. */
const size_t CHUNK_HEADER_SIZE = 5;

/** @brief Largest piece of a payload read from a socket at once. */
const size_t CHUNK_READ_BLOCK_SIZE = 64 * 1024;

/**
 * @brief Fixed-width prefix of every chunk.
 */
struct ChunkHeader {
  MessageKind kind;
  /** @brief Number of payload bytes that follow the header. */
  uint32_t length;
};

/**
 * @brief One framed unit of the nailgun protocol.
 */
class Chunk {
 public:
  /** @brief Constructs an empty heartbeat chunk. */
  Chunk() : header{MessageKind::HEARTBEAT, 0} {}
  /**
   * @brief Builds a chunk and derives the header length from the payload.
   * @throws std::length_error when the payload cannot be framed in 32 bits.
   */
  Chunk(MessageKind _kind, const string& _payload);
  /**
   * @brief Pairs an already decoded header with the payload read after it.
   */
  Chunk(const ChunkHeader& _header, const string& _payload);

  const ChunkHeader& getHeader() const { return header; }
  MessageKind getKind() const { return header.kind; }
  const string& getPayload() const { return payload; }

  /** @brief Returns the serialized byte count including the header. */
  size_t length() const { return CHUNK_HEADER_SIZE + payload.length(); }

  /** @brief Header followed by the payload, ready for the socket. */
  string serialize() const;

 protected:
  ChunkHeader header;
  string payload;
};

/**
 * @brief Length of a payload as it goes in a chunk header.
 * @throws std::length_error when the payload is longer than UINT32_MAX.
 */
uint32_t checkedPayloadLength(const string& payload);

/**
 * @brief Encodes a header as a big-endian uint32 length then the tag byte.
 */
string encodeChunkHeader(const ChunkHeader& header);

/**
 * @brief Encodes a full chunk: header followed by the payload verbatim.
 * @throws std::length_error when the payload is longer than UINT32_MAX.
 */
string encodeChunk(MessageKind kind, const string& payload);

/**
 * @brief Parses a 5-byte header.
 * @throws ProtocolDecodeError when the input is not exactly 5 bytes.
 * @throws UnknownMessageTypeError when the tag byte is not a known kind.
 */
ChunkHeader decodeChunkHeader(const string& bytes);
}  // namespace railgun

#endif  // __RAILGUN_CHUNK__
