#include "relq/read/read_resolver.hpp"
#include "relq/write/plan_runner.hpp"
#include "relq/write/write_planner.hpp"

#include "fixtures/blog_schema.hpp"

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using namespace relq::write;
using relq::testing::BlogStore;
using relq::testing::text;

using Clock = std::chrono::steady_clock;

struct Timing final {
    const char* name = "";
    // Plan operations for writes, queries issued for reads.
    std::size_t work = 0U;
    std::vector<std::chrono::microseconds> runs{};
};

// Runs body once per sample; body returns the work count of that run.
template <typename Body>
Timing time_runs(const char* name, std::size_t samples, Body&& body)
{
    Timing timing{name};
    timing.runs.reserve(samples);
    for (std::size_t sample = 0U; sample < samples; ++sample) {
        const auto start = Clock::now();
        timing.work = body(sample);
        timing.runs.push_back(std::chrono::duration_cast<std::chrono::microseconds>(Clock::now() - start));
    }
    return timing;
}

void report(Timing timing)
{
    if (timing.runs.empty()) {
        return;
    }
    std::sort(timing.runs.begin(), timing.runs.end());
    std::cout << timing.name << ": work=" << timing.work
              << " best=" << timing.runs.front().count() << "us"
              << " median=" << timing.runs[timing.runs.size() / 2U].count() << "us"
              << " worst=" << timing.runs.back().count() << "us\n";
}

// One user with a profile and eight posts, each tagged with both categories.
WriteRequest make_nested_create(std::size_t sample)
{
    std::vector<WriteDirective> posts;
    for (int i = 0; i < 8; ++i) {
        posts.push_back(CreateDirective{WritePayload{}
                                            .set("title", "post " + std::to_string(i))
                                            .with(relation("categories",
                                                           std::vector<WriteDirective>{
                                                               ConnectDirective{{{"name", text("news")}}},
                                                               ConnectDirective{{{"name", text("tech")}}},
                                                           }))});
    }
    return WriteRequest::create("User",
                                WritePayload{}
                                    .set("email", "bench" + std::to_string(sample) + "@x.io")
                                    .with(relation("profile", CreateDirective{WritePayload{}.set("bio", "bench")}))
                                    .with(relation("posts", std::move(posts))));
}

relq::read::ReadSpec include_tree()
{
    relq::read::ReadSpec posts;
    posts.include("categories");
    relq::read::ReadSpec spec;
    spec.include("posts", std::move(posts));
    spec.include("profile");
    return spec;
}

}  // namespace

// Usage: relq_benchmarks [samples]
int main(int argc, char** argv)
{
    const std::size_t samples = argc > 1 ? std::strtoul(argv[1], nullptr, 10) : 50U;
    if (samples == 0U) {
        std::cerr << "relq_benchmarks: sample count must be a positive integer\n";
        return 1;
    }

    try {
        const auto schema = relq::testing::make_blog_schema();
        const auto request = make_nested_create(0U);
        report(time_runs("plan_nested_create", samples, [&](std::size_t) { return plan_write(schema, request).operations.size(); }));

        BlogStore writes;
        report(time_runs("execute_nested_create", samples, [&](std::size_t sample) {
            return execute_write(writes.context(), make_nested_create(sample)).operations_executed;
        }));

        BlogStore reads;
        for (std::size_t i = 0U; i < 16U; ++i) {
            (void)execute_write(reads.context(), make_nested_create(i));
        }
        const auto spec = include_tree();
        report(time_runs("resolve_include_tree", samples, [&](std::size_t) {
            return relq::read::resolve_read(reads.context(), relq::read::RootFetch::find_many("User"), spec).queries_issued;
        }));
    } catch (const std::exception& ex) {
        std::cerr << "relq_benchmarks: " << ex.what() << '\n';
        return 1;
    }
    return 0;
}
