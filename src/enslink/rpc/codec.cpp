#include <enslink/rpc/codec.hpp>

#include <google/protobuf/message_lite.h>
#include <grpcpp/support/byte_buffer.h>
#include <grpcpp/support/slice.h>

namespace enslink::rpc::codec {

    std::vector<uint8_t> encode(const google::protobuf::MessageLite &message) {
        std::vector<uint8_t> data(message.ByteSizeLong());
        if (!data.empty() && !message.SerializeToArray(data.data(), static_cast<int>(data.size()))) {
            data.clear();
        }
        return data;
    }

    bool decode(const std::vector<uint8_t> &data, google::protobuf::MessageLite &message) {
        return message.ParseFromArray(data.data(), static_cast<int>(data.size()));
    }

    grpc::ByteBuffer to_byte_buffer(const std::vector<uint8_t> &data) {
        grpc::Slice slice(data.data(), data.size());
        return grpc::ByteBuffer(&slice, 1);
    }

    bool from_byte_buffer(const grpc::ByteBuffer &buffer, std::vector<uint8_t> &data) {
        std::vector<grpc::Slice> slices;
        if (!buffer.Dump(&slices).ok()) {
            return false;
        }

        data.clear();
        data.reserve(buffer.Length());
        for (const auto &slice : slices) {
            data.insert(data.end(), slice.begin(), slice.end());
        }
        return true;
    }

} // namespace enslink::rpc::codec
