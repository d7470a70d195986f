#include <Poco/URI.h>
#include <brsplit/Exception.h>
#include <brsplit/SetThreadName.h>
#include <brsplit/pd/Client.h>
#include <grpcpp/client_context.h>
#include <kvproto/pdpb.pb.h>

#include <chrono>
#include <deque>
#include <mutex>

namespace brsplit
{
namespace pd
{
inline std::vector<std::string> addrsToUrls(const std::vector<std::string> & addrs, const ClusterConfig & config)
{
    std::vector<std::string> urls;
    for (const std::string & addr : addrs)
    {
        if (addr.find("://") == std::string::npos)
        {
            if (config.ca_path.empty())
            {
                urls.push_back("http://" + addr);
            }
            else
            {
                urls.push_back("https://" + addr);
            }
        }
        else
        {
            urls.push_back(addr);
        }
    }
    return urls;
}

Client::Client(const std::vector<std::string> & addrs, const ClusterConfig & config_)
    : max_init_cluster_retries(100)
    , pd_timeout(3)
    , loop_interval(100)
    , update_leader_interval(60)
    , cluster_id(0)
    , work_threads_stop(false)
    , check_leader(false)
    , log(&Logger::get("brsplit.pd"))
{
    urls = addrsToUrls(addrs, config_);
    config = config_;

    initClusterID();

    initLeader();

    work_thread = std::thread([&]() { leaderLoop(); });

    check_leader.store(false);
}

Client::~Client()
{
    work_threads_stop = true;

    if (work_thread.joinable())
    {
        work_thread.join();
    }
}

std::shared_ptr<Client::PDConnClient> Client::getOrCreateGRPCConn(const std::string & addr)
{
    std::lock_guard lk(channel_map_mutex);
    auto it = channel_map.find(addr);
    if (it != channel_map.end())
    {
        return it->second;
    }
    Poco::URI uri(addr);
    auto client_ptr = std::make_shared<PDConnClient>(uri.getAuthority(), config);
    channel_map[addr] = client_ptr;

    return client_ptr;
}

std::string Client::getLeaderUrl()
{
    std::shared_lock lk(leader_mutex);
    return leader;
}

pdpb::GetMembersResponse Client::getMembers(const std::string & url)
{
    auto client = getOrCreateGRPCConn(url);
    auto resp = pdpb::GetMembersResponse{};

    grpc::ClientContext context;

    context.set_deadline(std::chrono::system_clock::now() + pd_timeout);

    auto status = client->stub->GetMembers(&context, pdpb::GetMembersRequest{}, &resp);
    if (!status.ok())
    {
        std::string err_msg = "get member failed: " + std::to_string(status.error_code()) + ": " + status.error_message();
        log->warning(err_msg);
        return {};
    }
    return resp;
}

std::shared_ptr<Client::PDConnClient> Client::leaderClient()
{
    std::shared_lock lk(leader_mutex);
    auto client = getOrCreateGRPCConn(leader);
    return client;
}

void Client::initClusterID()
{
    for (int i = 0; i < max_init_cluster_retries; ++i)
    {
        for (const auto & url : urls)
        {
            auto resp = getMembers(url);
            if (!resp.has_header())
            {
                log->warning("failed to get cluster id by :" + url + " retrying");
                continue;
            }
            if (resp.header().has_error())
            {
                log->warning("failed to init cluster id: " + resp.header().error().message());
                continue;
            }
            cluster_id = resp.header().cluster_id();
            log->information("init cluster id done: " + std::to_string(cluster_id));
            return;
        }
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }
    throw Exception("failed to init cluster id", InitClusterIDFailed);
}

void Client::initLeader()
{
    static const size_t init_leader_retry_times = 5;
    for (size_t i = 0; i < init_leader_retry_times; i++)
    {
        try
        {
            updateLeader();
            return;
        }
        catch (Exception & e)
        {
            if (i < init_leader_retry_times - 1)
            {
                log->warning("failed to update leader, will retry");
                std::this_thread::sleep_for(std::chrono::seconds(2));
            }
            else
            {
                log->warning("failed to update leader, stop retrying");
                throw;
            }
        }
    }
}

void Client::updateLeader()
{
    std::unique_lock lk(leader_mutex);
    for (const auto & url : urls)
    {
        auto resp = getMembers(url);
        if (!resp.has_header() || resp.leader().client_urls_size() == 0)
        {
            log->warning("failed to get leader by :" + url);
            failed_urls.insert(url);
            continue;
        }
        failed_urls.erase(url);
        updateURLs(resp.members());
        switchLeader(resp.leader().client_urls());
        return;
    }
    throw Exception("failed to update leader", UpdatePDLeaderFailed);
}

void Client::switchLeader(const ::google::protobuf::RepeatedPtrField<std::string> & leader_urls)
{
    std::string old_leader = leader;
    leader = leader_urls[0];
    if (leader == old_leader)
    {
        return;
    }

    log->information("switch leader from " + old_leader + " to " + leader);
    getOrCreateGRPCConn(leader);
}

void Client::updateURLs(const ::google::protobuf::RepeatedPtrField<::pdpb::Member> & members)
{
    std::deque<std::string> tmp_urls;
    for (const auto & member : members)
    {
        for (const auto & client_url : member.client_urls())
        {
            // urls that failed recently are tried last
            if (failed_urls.count(client_url) > 0)
            {
                tmp_urls.push_back(client_url);
            }
            else
            {
                tmp_urls.push_front(client_url);
            }
        }
    }
    urls = std::vector<std::string>(tmp_urls.begin(), tmp_urls.end());
}

void Client::leaderLoop()
{
    brsplit::SetThreadName("PDLeaderLoop");

    auto next_update_time = std::chrono::system_clock::now();

    for (;;)
    {
        bool should_update = false;
        std::unique_lock<std::mutex> lk(update_leader_mutex);
        auto now = std::chrono::system_clock::now();
        if (update_leader_cv.wait_until(lk, now + loop_interval, [this]() { return check_leader.load(); }))
        {
            should_update = true;
        }
        else
        {
            if (work_threads_stop)
            {
                return;
            }
            if (std::chrono::system_clock::now() >= next_update_time)
            {
                should_update = true;
                next_update_time = std::chrono::system_clock::now() + update_leader_interval;
            }
        }
        if (should_update)
        {
            try
            {
                check_leader.store(false);
                updateLeader();
            }
            catch (Exception & e)
            {
                log->warning(e.displayText());
            }
        }
    }
}

pdpb::RequestHeader * Client::requestHeader() const
{
    auto * header = new pdpb::RequestHeader();
    header->set_cluster_id(cluster_id);
    return header;
}

void Client::checkResponseHeader(const pdpb::ResponseHeader & header, const std::string & what)
{
    if (!header.has_error() || header.error().type() == pdpb::ErrorType::OK)
        return;
    const auto & err = header.error();
    std::string err_msg = what + " failed: " + pdpb::ErrorType_Name(err.type()) + ": " + err.message();
    log->warning(err_msg);
    if (err.type() == pdpb::ErrorType::REGION_NOT_FOUND)
        throw Exception(err_msg, RegionNotFound);
    if (err.type() == pdpb::ErrorType::NOT_BOOTSTRAPPED || err.type() == pdpb::ErrorType::UNKNOWN)
        check_leader.store(true);
    throw Exception(err_msg, PDServerError);
}

template <typename Req, typename Resp>
Resp Client::call(RPCMethod<Req, Resp> method, Req & request, const std::string & what)
{
    request.set_allocated_header(requestHeader());

    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + pd_timeout);

    Resp response;
    auto leader_client = leaderClient();
    auto status = ((*leader_client->stub).*method)(&context, request, &response);
    if (!status.ok())
    {
        std::string err_msg = what + " failed: " + std::to_string(status.error_code()) + ": " + status.error_message();
        log->warning(err_msg);
        check_leader.store(true);
        throw Exception(err_msg, GRPCErrorCode);
    }
    return response;
}

pdpb::GetRegionResponse Client::getRegionByKey(const std::string & key)
{
    pdpb::GetRegionRequest request;
    request.set_region_key(key);
    auto response = call(&pdpb::PD::Stub::GetRegion, request, "get region");
    checkResponseHeader(response.header(), "get region");
    return response;
}

pdpb::GetRegionResponse Client::getRegionByID(uint64_t region_id)
{
    pdpb::GetRegionByIDRequest request;
    request.set_region_id(region_id);
    auto response = call(&pdpb::PD::Stub::GetRegionByID, request, "get region by id");
    checkResponseHeader(response.header(), "get region by id");
    return response;
}

pdpb::ScanRegionsResponse Client::scanRegions(const std::string & start_key, const std::string & end_key, int limit)
{
    pdpb::ScanRegionsRequest request;
    request.set_start_key(start_key);
    request.set_end_key(end_key);
    request.set_limit(limit);
    auto response = call(&pdpb::PD::Stub::ScanRegions, request, "scan regions");
    checkResponseHeader(response.header(), "scan regions");

    // Servers before 5.0 only fill region_metas and leaders.
    if (response.regions_size() == 0)
    {
        for (int i = 0; i < response.region_metas_size(); i++)
        {
            auto * region = response.add_regions();
            *region->mutable_region() = response.region_metas(i);
            if (i < response.leaders_size())
                *region->mutable_leader() = response.leaders(i);
        }
    }
    return response;
}

metapb::Store Client::getStore(uint64_t store_id)
{
    pdpb::GetStoreRequest request;
    request.set_store_id(store_id);
    const std::string what = "get store " + std::to_string(store_id);
    auto response = call(&pdpb::PD::Stub::GetStore, request, what);
    checkResponseHeader(response.header(), what);
    return response.store();
}

void Client::scatterRegion(uint64_t region_id)
{
    pdpb::ScatterRegionRequest request;
    request.set_region_id(region_id);
    const std::string what = "scatter region " + std::to_string(region_id);
    auto response = call(&pdpb::PD::Stub::ScatterRegion, request, what);
    checkResponseHeader(response.header(), what);
}

// The header is returned untouched: a REGION_NOT_FOUND error there means no
// operator is running for the region.
pdpb::GetOperatorResponse Client::getOperator(uint64_t region_id)
{
    pdpb::GetOperatorRequest request;
    request.set_region_id(region_id);
    return call(&pdpb::PD::Stub::GetOperator, request, "get operator of region " + std::to_string(region_id));
}

} // namespace pd
} // namespace brsplit
