#include <brsplit/Exception.h>
#include <brsplit/kv/StoreClient.h>
#include <brsplit/kv/internal/conn.h>
#include <grpcpp/client_context.h>

#include <chrono>

namespace brsplit
{
namespace kv
{
kvrpcpb::SplitRegionResponse StoreClient::splitRegion(const std::string & addr, const kvrpcpb::SplitRegionRequest & req)
{
    KvConnClient conn(addr, config);

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + std::chrono::seconds(timeout));

    kvrpcpb::SplitRegionResponse resp;
    auto status = conn.stub->SplitRegion(&context, req, &resp);
    if (!status.ok())
    {
        std::string err_msg = "SplitRegion Failed, addr: " + addr + ", " + std::to_string(status.error_code()) + ": " + status.error_message();
        log->error(err_msg);
        throw Exception(err_msg, GRPCErrorCode);
    }
    return resp;
}

} // namespace kv
} // namespace brsplit
