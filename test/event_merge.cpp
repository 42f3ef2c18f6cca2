#include <rangeful/fn.hpp>
#include <rangeful/fallible.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <iostream>
#include <iomanip>
#include <string>
#include <vector>

/*
Merges per-host event logs, each ordered by time, into a single timeline;
tags the errors, prints the events per minute, and a 3-minute moving
average of event counts.

Each log is checked to be ordered before merging.
*/

namespace pt = boost::posix_time;
namespace greg = boost::gregorian;

struct event_t
{
     pt::ptime ts;
    std::string host;
    std::string msg;
};
using events_t = std::vector<event_t>;

static pt::ptime at(int h, int m, int s)
{
    return pt::ptime(greg::date(2020, greg::Mar, 1), pt::time_duration(h, m, s));
}

static events_t GetLog(const std::string& host)
{
    events_t ret;

    if(host == "db") {
        ret = events_t{{
            { at(9, 0,  5), host, "checkpoint started" },
            { at(9, 0, 40), host, "checkpoint done" },
            { at(9, 2, 10), host, "ERROR: replication lag" },
            { at(9, 2, 11), host, "replica reconnected" } }};
    } else if(host == "web") {
        ret = events_t{{
            { at(9, 0, 5),  host, "GET /" },
            { at(9, 0, 6),  host, "GET /login" },
            { at(9, 1, 30), host, "POST /login" },
            { at(9, 2, 10), host, "ERROR: upstream timeout" },
            { at(9, 3, 0),  host, "GET /" } }};
    }
    return ret;
}

// Fails with a description of the first out-of-order event, if any.
static std::string CheckOrdered(const events_t& log)
{
    namespace fn = rangeful::fn;
    using fn::operators::operator%;
    using step_t = fn::fold_step<pt::ptime, std::string>;

    auto res = log % fn::try_foldl(pt::ptime(pt::neg_infin), [](pt::ptime prev, const event_t& e) -> step_t
    {
        if(e.ts < prev) {
            return fn::fail(e.host + ": '" + e.msg + "' at " + pt::to_simple_string(e.ts)
                          + " precedes " + pt::to_simple_string(prev));
        }
        return fn::proceed(e.ts);
    });

    return res.ok() ? std::string{} : res.error();
}

int main()
{
    namespace fn = rangeful::fn;
    using fn::operators::operator%;

    std::vector<fn::any_seq_t<event_t>> logs;

    for(const std::string host : { "db", "web" }) {
        auto log = GetLog(host);
        const auto err = CheckOrdered(log);
        if(!err.empty()) {
            std::cerr << "Unordered log: " << err << "\n";
            return 1;
        }
        logs.emplace_back(fn::to_seq()(std::move(log)));
    }

    // heartbeats are generated lazily, every 45 seconds
    logs.emplace_back(fn::seq([t = at(9, 0, 0)]() mutable
    {
        auto ret = event_t{ t, "monitor", "heartbeat" };
        t += pt::seconds(45);
        return ret.ts < at(9, 4, 0) ? ret : fn::end_seq();
    }));

    const auto minute_of = [](const event_t& e)
    {
        return e.ts.time_of_day().hours() * 60 + e.ts.time_of_day().minutes();
    };

    auto counts = std::move(logs)
      % fn::merge_sorted_by([](const event_t& e) { return e.ts; })

      % fn::with_filtered([](const event_t& e) { return e.msg.compare(0, 6, "ERROR:") == 0; },
                          [](fn::any_seq_t<event_t> errors)
        {
            return std::move(errors) % fn::transform([](event_t e)
            {
                e.msg = "!! " + e.msg;
                return e;
            });
        })

      % fn::group_adjacent_as_subseqs_by(minute_of)

      % fn::transform([](fn::any_seq_t<event_t> minute_events)
        {
            return std::move(minute_events) % fn::foldl(0, [](int n, const event_t& e)
            {
                std::cout << pt::to_simple_string(e.ts.time_of_day())
                          << "  " << std::setw(8) << std::left << e.host
                          << e.msg << "\n";
                return n + 1;
            });
        })

      % fn::to_vector();

    std::cout << "\nEvents per minute: ";
    for(auto n : counts) {
        std::cout << n << " ";
    }

    std::cout << "\n3-minute moving average: ";
    std::move(counts)
      % fn::sliding_window(3)
      % fn::for_each([](const std::vector<int>& win)
        {
            std::cout << std::fixed << std::setprecision(2)
                      << double(win[0] + win[1] + win[2]) / 3 << " ";
        });
    std::cout << "\n";

    return 0;
}
