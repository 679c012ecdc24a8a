#pragma once

#include <cstdint>
#include <vector>

namespace google::protobuf {
    class MessageLite;
} // namespace google::protobuf

namespace grpc {
    class ByteBuffer;
} // namespace grpc

namespace enslink::rpc::codec {

    // protobuf message <-> byte vector
    std::vector<uint8_t> encode(const google::protobuf::MessageLite &message);
    bool decode(const std::vector<uint8_t> &data, google::protobuf::MessageLite &message);

    // byte vector <-> gRPC byte buffer
    grpc::ByteBuffer to_byte_buffer(const std::vector<uint8_t> &data);
    bool from_byte_buffer(const grpc::ByteBuffer &buffer, std::vector<uint8_t> &data);

} // namespace enslink::rpc::codec
