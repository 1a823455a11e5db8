#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "student_grouper/allocation.hpp"
#include "student_grouper/branch.hpp"
#include "student_grouper/config.hpp"
#include "student_grouper/report.hpp"
#include "student_grouper/request.hpp"
#include "student_grouper/state.hpp"
#include "student_grouper/types.hpp"

namespace student_grouper
{
namespace
{

using json = nlohmann::json;

void send_error(httplib::Response &res, const std::string &message, int status = 400)
{
    json error;
    error["status"] = "error";
    error["message"] = message;
    res.status = status;
    res.set_content(error.dump(), "application/json");
}

RosterRequest to_roster_request(const httplib::Request &req)
{
    RosterRequest request;
    request.content_type = req.get_header_value("Content-Type");
    request.body = req.body;
    if (req.has_param("groups"))
    {
        request.groups_param = req.get_param_value("groups");
    }
    return request;
}

json build_roster_payload(const std::vector<Record> &records, const std::vector<std::string> &priority)
{
    json branch_counts = json::object();
    for (const auto &[code, count] : count_branches(records))
    {
        branch_counts[code] = count;
    }

    json response;
    response["status"] = "success";
    response["records_count"] = records.size();
    response["branch_counts"] = branch_counts;
    response["draw_cycle"] = build_draw_cycle(records, priority);
    return response;
}

json build_allocation_payload(int total_groups, const AllocationResult &branchwise, const AllocationResult &uniform,
                              long long total_ms)
{
    json response;
    response["status"] = "success";
    response["groups"] = total_groups;
    response["branchwise"] = allocation_to_json(branchwise);
    response["uniform"] = allocation_to_json(uniform);
    response["timing"] = {
        {"branchwise_ms", branchwise.computation_time_ms},
        {"uniform_ms", uniform.computation_time_ms},
        {"total_ms", total_ms}};
    return response;
}

void send_attachment(httplib::Response &res, std::string contents, const std::string &file_name,
                     const std::string &content_type)
{
    res.set_header("Content-Disposition", "attachment; filename=\"" + file_name + "\"");
    res.set_content(std::move(contents), content_type);
}

std::string resolve_config_path(int argc, char **argv)
{
    if (argc > 1)
    {
        return argv[1];
    }
    const char *from_env = std::getenv("STUDENT_GROUPER_CONFIG");
    return from_env ? from_env : "student_grouper.json";
}

} // namespace
} // namespace student_grouper

int main(int argc, char **argv)
{
    using namespace student_grouper;

    try
    {
        service_config = load_service_config(resolve_config_path(argc, argv));
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Config error: " << ex.what() << std::endl;
        return 1;
    }

    httplib::Server server;

    server.set_pre_routing_handler([](const httplib::Request &req, httplib::Response &res)
                                   {
        res.set_header("Access-Control-Allow-Origin", "*");
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (req.method == "OPTIONS")
        {
            res.status = 200;
            return httplib::Server::HandlerResponse::Handled;
        }
        return httplib::Server::HandlerResponse::Unhandled; });

    server.Get("/health", [](const httplib::Request &, httplib::Response &res)
               { res.set_content(json{{"status", "ok"}}.dump(), "application/json"); });

    server.Get("/config", [](const httplib::Request &, httplib::Response &res)
               {
        std::lock_guard<std::mutex> lock(state_mutex);
        json response;
        response["status"] = "success";
        response["config"] = service_config_to_json(service_config);
        res.set_content(response.dump(2), "application/json"); });

    server.Post("/upload-roster", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            const auto parse_start = std::chrono::high_resolution_clock::now();
            long fetch_timeout_seconds = 0;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                fetch_timeout_seconds = service_config.fetch_timeout_seconds;
            }
            auto records = roster_from_request(to_roster_request(req), fetch_timeout_seconds);
            const auto parse_end = std::chrono::high_resolution_clock::now();

            std::lock_guard<std::mutex> lock(state_mutex);
            roster = std::move(records);
            roster_loaded = true;
            reset_allocation_results();

            std::cout << "Roster loaded with " << roster.size() << " records." << std::endl;

            json response = build_roster_payload(roster, service_config.priority_branches);
            response["timing"] = {
                {"parse_ms", std::chrono::duration_cast<std::chrono::milliseconds>(parse_end - parse_start).count()}};
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/run-allocation", [](const httplib::Request &req, httplib::Response &res)
                {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!roster_loaded)
        {
            send_error(res, "Roster not loaded. Call /upload-roster first.", 409);
            return;
        }

        try
        {
            const int total_groups = group_count_from_request(to_roster_request(req), service_config);

            const auto total_start = std::chrono::high_resolution_clock::now();
            auto results = run_allocations(roster, total_groups, service_config.priority_branches);
            const auto total_end = std::chrono::high_resolution_clock::now();

            branchwise_result = std::move(results.first);
            uniform_result = std::move(results.second);
            last_group_count = total_groups;

            const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(total_end - total_start).count();
            const auto response = build_allocation_payload(total_groups, branchwise_result, uniform_result, total_ms);
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Post("/allocate", [](const httplib::Request &req, httplib::Response &res)
                {
        try
        {
            ServiceConfig config;
            {
                std::lock_guard<std::mutex> lock(state_mutex);
                config = service_config;
            }

            const auto request = to_roster_request(req);
            const int total_groups = group_count_from_request(request, config);
            const auto records = roster_from_request(request, config.fetch_timeout_seconds);

            const auto total_start = std::chrono::high_resolution_clock::now();
            const auto results = run_allocations(records, total_groups, config.priority_branches);
            const auto total_end = std::chrono::high_resolution_clock::now();

            const auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(total_end - total_start).count();
            const auto response = build_allocation_payload(total_groups, results.first, results.second, total_ms);
            res.set_content(response.dump(), "application/json");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what());
        } });

    server.Get("/export-report", [](const httplib::Request &, httplib::Response &res)
               {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (last_group_count == 0)
        {
            send_error(res, "Allocation not run. Call /run-allocation first.", 409);
            return;
        }

        try
        {
            send_attachment(res, build_group_report(branchwise_result, uniform_result), "student_groups.xlsx",
                            "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what(), 500);
        } });

    server.Get("/export-branches", [](const httplib::Request &, httplib::Response &res)
               {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (!roster_loaded)
        {
            send_error(res, "Roster not loaded. Call /upload-roster first.", 409);
            return;
        }

        try
        {
            send_attachment(res, build_branch_archive(roster), "branches_csv.zip", "application/zip");
        }
        catch (const std::exception &ex)
        {
            send_error(res, ex.what(), 500);
        } });

    std::cout << "Server starting on http://" << service_config.host << ":" << service_config.port << std::endl;
    if (!server.listen(service_config.host, service_config.port))
    {
        std::cerr << "Unable to listen on " << service_config.host << ":" << service_config.port << std::endl;
        return 1;
    }
    return 0;
}
