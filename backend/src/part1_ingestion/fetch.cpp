#include "student_grouper/fetch.hpp"

#include <curl/curl.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "student_grouper/roster.hpp"

namespace student_grouper
{
    namespace
    {
        size_t write_callback(void *contents, size_t size, size_t nmemb, void *userp)
        {
            ((std::string *)userp)->append((char *)contents, size * nmemb);
            return size * nmemb;
        }
    }

    std::string fetch_roster_payload(const std::string &url, long timeout_seconds)
    {
        std::cout << "Fetching roster from " << url << "..." << std::endl;

        CURL *curl = curl_easy_init();
        if (!curl)
        {
            throw std::runtime_error("Failed to initialize CURL");
        }

        std::string response_data;

        curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_data);
        curl_easy_setopt(curl, CURLOPT_USERAGENT, "StudentGrouper/1.0");
        curl_easy_setopt(curl, CURLOPT_TIMEOUT, timeout_seconds);
        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);

        const CURLcode res = curl_easy_perform(curl);

        long http_code = 0;
        if (res == CURLE_OK)
        {
            curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
        }
        curl_easy_cleanup(curl);

        if (res != CURLE_OK)
        {
            std::cerr << "Roster fetch failed: " << curl_easy_strerror(res) << std::endl;
            throw std::runtime_error(std::string("Roster fetch failed: ") + curl_easy_strerror(res));
        }
        if (http_code != 200)
        {
            std::cerr << "Roster fetch returned HTTP " << http_code << std::endl;
            throw std::runtime_error("Roster fetch returned HTTP " + std::to_string(http_code));
        }

        std::cout << "Fetched " << response_data.size() << " bytes from " << url << std::endl;
        return response_data;
    }

    std::vector<Record> fetch_roster(const std::string &url, long timeout_seconds)
    {
        return parse_roster_payload(fetch_roster_payload(url, timeout_seconds));
    }

}
