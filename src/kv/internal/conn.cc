#include <brsplit/kv/internal/conn.h>
#include <grpcpp/security/credentials.h>

namespace brsplit
{
namespace kv
{

KvConnClient::KvConnClient(const std::string & addr, const ClusterConfig & config)
{
    grpc::ChannelArguments ch_args;
    // set max size that gRPC client can receive to max value.
    ch_args.SetMaxReceiveMessageSize(-1);
    ch_args.SetInt(GRPC_ARG_MIN_RECONNECT_BACKOFF_MS, 1 * 1000);
    ch_args.SetInt(GRPC_ARG_MAX_RECONNECT_BACKOFF_MS, 3 * 1000);
    ch_args.SetInt(GRPC_ARG_INITIAL_RECONNECT_BACKOFF_MS, 1 * 1000);
    // a fresh channel per request must not be shared with other requests.
    ch_args.SetInt(GRPC_ARG_USE_LOCAL_SUBCHANNEL_POOL, 1);
    std::shared_ptr<grpc::ChannelCredentials> cred;
    if (config.hasTlsConfig())
    {
        cred = grpc::SslCredentials(config.getGrpcCredentials());
    }
    else
    {
        cred = grpc::InsecureChannelCredentials();
    }

    channel = grpc::CreateCustomChannel(addr, cred, ch_args);

    stub = tikvpb::Tikv::NewStub(channel);
}

} // namespace kv
} // namespace brsplit
