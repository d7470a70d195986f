#pragma once

#include <brsplit/Config.h>
#include <brsplit/Log.h>
#include <brsplit/pd/IClient.h>
#include <grpcpp/channel.h>
#include <grpcpp/client_context.h>
#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>
#include <kvproto/pdpb.grpc.pb.h>

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <shared_mutex>
#include <thread>
#include <unordered_map>
#include <unordered_set>

namespace brsplit
{
namespace pd
{
class Client : public IClient
{
    const int max_init_cluster_retries;

    const std::chrono::seconds pd_timeout;

    const std::chrono::microseconds loop_interval;

    const std::chrono::seconds update_leader_interval;

public:
    Client(const std::vector<std::string> & addrs, const ClusterConfig & config);

    ~Client() override;

    pdpb::GetRegionResponse getRegionByKey(const std::string & key) override;

    pdpb::GetRegionResponse getRegionByID(uint64_t region_id) override;

    pdpb::ScanRegionsResponse scanRegions(const std::string & start_key, const std::string & end_key, int limit) override;

    metapb::Store getStore(uint64_t store_id) override;

    void scatterRegion(uint64_t region_id) override;

    pdpb::GetOperatorResponse getOperator(uint64_t region_id) override;

    std::string getLeaderUrl() override;

private:
    void initClusterID();

    void updateLeader();

    void initLeader();

    void updateURLs(const ::google::protobuf::RepeatedPtrField<::pdpb::Member> & members);

    void leaderLoop();

    void switchLeader(const ::google::protobuf::RepeatedPtrField<std::string> &);

    template <typename Req, typename Resp>
    using RPCMethod = grpc::Status (pdpb::PD::Stub::*)(grpc::ClientContext *, const Req &, Resp *);

    // Sends request to the leader with a fresh header and deadline. Transport
    // errors mark the leader for a refresh and raise GRPCErrorCode.
    template <typename Req, typename Resp>
    Resp call(RPCMethod<Req, Resp> method, Req & request, const std::string & what);

    // Raises when the header carries an error, invalidating the leader for
    // not-leader style failures.
    void checkResponseHeader(const pdpb::ResponseHeader & header, const std::string & what);

    struct PDConnClient
    {
        std::shared_ptr<grpc::Channel> channel;
        std::unique_ptr<pdpb::PD::Stub> stub;
        PDConnClient(std::string addr, const ClusterConfig & config)
        {
            if (config.hasTlsConfig())
            {
                channel = grpc::CreateChannel(addr, grpc::SslCredentials(config.getGrpcCredentials()));
            }
            else
            {
                channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());
            }
            stub = pdpb::PD::NewStub(channel);
        }
    };

    std::shared_ptr<PDConnClient> leaderClient();

    pdpb::GetMembersResponse getMembers(const std::string &);

    pdpb::RequestHeader * requestHeader() const;

    std::shared_ptr<PDConnClient> getOrCreateGRPCConn(const std::string &);

    std::shared_mutex leader_mutex;

    std::mutex channel_map_mutex;

    std::mutex update_leader_mutex;

    std::unordered_map<std::string, std::shared_ptr<PDConnClient>> channel_map;

    std::vector<std::string> urls;

    std::unordered_set<std::string> failed_urls;

    uint64_t cluster_id;

    std::string leader;

    std::atomic<bool> work_threads_stop;

    std::thread work_thread;

    std::condition_variable update_leader_cv;

    std::atomic<bool> check_leader;

    ClusterConfig config;

    Logger * log;
};

} // namespace pd
} // namespace brsplit
