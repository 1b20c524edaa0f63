//=============================================================================
// GridView Tests
//
// Event entry points, external failure signals and redraw behaviour
//=============================================================================

#include <cstddef>
#include <version>
#include <algorithm>
#include <thread>

#include <boost/ut.hpp>
#include <cloudgrid/grid-view.h>
#include "harness/recording_canvas.h"

using namespace boost::ut;
using namespace cloudgrid;
using namespace cloudgrid::test;

namespace {

struct Fixture {
    std::shared_ptr<RecordingCanvas> canvas = std::make_shared<RecordingCanvas>();
    GridView::Ptr view;

    explicit Fixture(std::vector<Target> targets, GridViewOptions options = {}) {
        auto res = GridView::create(std::move(targets), canvas, std::move(options));
        if (res) {
            view = *res;
            view->size(80, 24);
        }
    }
};

TestResults results(uint32_t failures) {
    TestResults r;
    r.failureCount = failures;
    for (uint32_t i = 0; i < failures; ++i) {
        r.failedTests.push_back({"test " + std::to_string(i + 1), "boom", "Error: boom"});
    }
    return r;
}

} // namespace

suite grid_view_create_tests = [] {
    "null canvas is rejected"_test = [] {
        auto res = GridView::create({{"Chrome", "70", "Windows 10"}}, nullptr);
        expect(!res.has_value());
    };

    "cell width comes from the whole target set"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}, {"Internet Explorer", "11", "Windows 2012"}});
        expect((f.view != nullptr) >> fatal);
        expect(f.view->cellWidth() == 20u);
        expect(f.view->browsers().size() == 2u);
        expect(f.view->browsers()[1].target().name == "Internet Explorer");
    };

    "nothing is drawn before size"_test = [] {
        auto canvas = std::make_shared<RecordingCanvas>();
        auto res = GridView::create({{"Chrome", "70", "Windows 10"}}, canvas);
        expect((res.has_value()) >> fatal);
        auto view = *res;

        view->render();
        expect(canvas->ops().empty());

        view->size(80, 24);
        view->render();
        expect(!canvas->ops().empty());
        expect(view->width() == 80u);
        expect(view->height() == 24u);
    };

    "empty target set draws only the separator"_test = [] {
        Fixture f(std::vector<Target>{});
        expect((f.view != nullptr) >> fatal);
        expect(f.view->cellWidth() == 0u);
        f.view->render();
        expect(f.canvas->ops().size() == 1u);
    };
};

suite grid_view_event_tests = [] {
    "single target example"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        f.view->render();
        expect(f.canvas->textAt(4, 3, 9) == "Chrome 70");
        expect(f.canvas->textAt(4, 4, 10) == "Windows 10");
    };

    "every event redraws"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        expect(f.view->onInit(0).has_value());
        auto afterInit = f.canvas->ops().size();
        expect(afterInit > 0u);

        expect(f.view->onStart(0).has_value());
        auto afterStart = f.canvas->ops().size();
        expect(afterStart == 2 * afterInit);

        expect(f.view->onEnd(0, results(0)).has_value());
        expect(f.canvas->ops().size() == 3 * afterInit);
    };

    "passing run ends with the ok symbol"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        (void)f.view->onInit(0);
        expect(f.canvas->cellAt(15, 3)->glyph == " ");
        (void)f.view->onEnd(0, results(0));
        expect(f.canvas->cellAt(15, 3)->glyph == "✓");
        expect(f.canvas->cellAt(15, 3)->color == 32);
        expect(f.view->browsers()[0].state() == TargetState::Ended);
    };

    "failing run ends with the error symbol"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        (void)f.view->onEnd(0, results(2));
        expect(f.canvas->cellAt(15, 3)->glyph == "✖");
        expect(f.view->totalFailures() == 2u);
    };

    "unknown target index is an error"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        auto res = f.view->onStart(7);
        expect(!res.has_value());
        expect(res.error().kind() == ErrorKind::UnknownTarget);
        expect(f.canvas->ops().empty()) << "rejected events do not redraw";
    };

    "indexOf finds exact identities"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}, {"Chrome", "71", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        expect(f.view->indexOf("Chrome", "71", "Windows 10") == std::optional<size_t>(1));
        expect(!f.view->indexOf("chrome", "71", "Windows 10").has_value());
    };
};

suite grid_view_mark_failed_tests = [] {
    "remote names are normalized before matching"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 2012"}, {"Firefox", "63", "Windows 2012"}});
        expect((f.view != nullptr) >> fatal);
        (void)f.view->onStart(0);

        auto matched = f.view->markAsFailed("Chrome", "70", "Windows 8");

        expect(matched == 1u);
        expect(f.view->browsers()[0].state() == TargetState::Failed);
        expect(f.view->browsers()[1].state() == TargetState::Pending);
        // cell width 12 ("Windows 2012"), symbol two past it
        expect(f.canvas->cellAt(17, 3)->glyph == "✖");
        expect(f.canvas->cellAt(17, 3)->color == 31);
    };

    "matching ignores version and case"_test = [] {
        Fixture f({{"chrome", "70", "windows 2012"}, {"CHROME", "71", "Windows 2012"}});
        expect((f.view != nullptr) >> fatal);

        expect(f.view->markAsFailed("Chrome", "99", "Windows 8") == 2u);
        expect(f.view->browsers()[0].state() == TargetState::Failed);
        expect(f.view->browsers()[1].state() == TargetState::Failed);
    };

    "unknown identity changes nothing but still redraws"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}, {"Firefox", "63", "Linux"}});
        expect((f.view != nullptr) >> fatal);

        f.view->render();
        auto before = f.canvas->ops();
        f.canvas->clearOps();

        expect(f.view->markAsFailed("Unknown", "1", "Nowhere") == 0u);
        expect(f.canvas->ops() == before);
        for (const auto& b : f.view->browsers()) {
            expect(b.state() == TargetState::Pending);
        }
    };

    "known browser on unknown platform is ignored"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        expect(f.view->markAsFailed("Chrome", "70", "Windows 10") == 0u);
        expect(f.view->browsers()[0].state() == TargetState::Pending);
    };

    "failed stays failed after a passing end"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 2012"}});
        expect((f.view != nullptr) >> fatal);

        (void)f.view->onStart(0);
        f.view->markAsFailed("Chrome", "70", "Windows 8");
        (void)f.view->onEnd(0, results(0));

        expect(f.view->browsers()[0].state() == TargetState::Failed);
        expect(f.canvas->cellAt(17, 3)->glyph == "✖");
        expect(f.canvas->cellAt(17, 3)->color == 31);
    };

    "injected tables drive resolution"_test = [] {
        GridViewOptions options;
        options.tables = NormalizationTables{};
        options.tables.browserNames["Edge"] = "edge";
        options.tables.platformNames["Windows 11"] = "Windows 2022";
        Fixture f({{"edge", "120", "Windows 2022"}, {"Chrome", "70", "Windows 2012"}}, options);
        expect((f.view != nullptr) >> fatal);

        expect(f.view->markAsFailed("Edge", "120", "Windows 11") == 1u);
        expect(f.view->markAsFailed("Chrome", "70", "Windows 8") == 0u);
        expect(f.view->browsers()[1].state() == TargetState::Pending);
    };
};

suite grid_view_report_tests = [] {
    "failures are collected after the run"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}, {"Firefox", "63", "Linux"}});
        expect((f.view != nullptr) >> fatal);

        (void)f.view->onEnd(0, results(0));
        (void)f.view->onEnd(1, results(2));

        auto reports = f.view->collectFailures();
        expect((reports.has_value()) >> fatal);
        expect(reports->size() == 1u);
        expect((*reports)[0].label == "Firefox 63");
        expect((*reports)[0].failures.size() == 2u);
        expect((*reports)[0].failures[0].title == "test 1");
        expect((*reports)[0].failures[1].title == "test 2");
    };

    "collecting early reports missing results"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}, {"Firefox", "63", "Linux"}});
        expect((f.view != nullptr) >> fatal);

        (void)f.view->onEnd(0, results(1));
        auto reports = f.view->collectFailures();
        expect(!reports.has_value());
        expect(reports.error().kind() == ErrorKind::MissingResults);
    };
};

suite grid_view_threading_tests = [] {
    "events from several threads are serialized"_test = [] {
        std::vector<Target> targets;
        for (int i = 0; i < 8; ++i) {
            targets.push_back({"Browser" + std::to_string(i), "1", "Linux"});
        }
        Fixture f(targets);
        expect((f.view != nullptr) >> fatal);

        std::vector<std::thread> threads;
        for (size_t i = 0; i < targets.size(); ++i) {
            threads.emplace_back([&f, i] {
                (void)f.view->onInit(i);
                (void)f.view->onStart(i);
                (void)f.view->onEnd(i, results(0));
            });
        }
        for (auto& t : threads) t.join();

        for (const auto& b : f.view->browsers()) {
            expect(b.state() == TargetState::Ended);
        }
        // 24 renders of 8 cells (6 ops each) plus the separator
        expect(f.canvas->ops().size() == 24u * (8u * 6u + 1u));
    };
};

suite grid_view_snapshot_tests = [] {
    "snapshot is a copy"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        auto before = f.view->snapshot();
        (void)f.view->onEnd(0, results(1));

        expect(before[0].state() == TargetState::Pending);
        expect(!before[0].results().has_value());
        expect(f.view->snapshot()[0].state() == TargetState::Ended);
    };

    "snapshot can be read while events arrive"_test = [] {
        std::vector<Target> targets;
        for (int i = 0; i < 4; ++i) {
            targets.push_back({"Browser" + std::to_string(i), "1", "Linux"});
        }
        Fixture f(targets);
        expect((f.view != nullptr) >> fatal);

        std::thread writer([&f, n = targets.size()] {
            for (size_t i = 0; i < n; ++i) {
                (void)f.view->onStart(i);
                (void)f.view->onEnd(i, results(0));
            }
        });
        size_t ended = 0;
        for (int round = 0; round < 100; ++round) {
            ended = 0;
            for (const auto& b : f.view->snapshot()) {
                if (b.state() == TargetState::Ended) ++ended;
            }
            expect(ended <= 4u);
        }
        writer.join();

        auto last = f.view->snapshot();
        expect(std::all_of(last.begin(), last.end(), [](const BrowserState& b) {
            return b.state() == TargetState::Ended;
        }));
    };

    "unresolvable names are absorbed, not reported"_test = [] {
        Fixture f({{"Chrome", "70", "Windows 10"}});
        expect((f.view != nullptr) >> fatal);

        expect(f.view->markAsFailed("Netscape", "4", "Windows 95") == 0u);
        expect(f.view->collectFailures().has_value() == false);
        expect(f.view->collectFailures().error().kind() == ErrorKind::MissingResults)
            << "the only error left is the missing end";
        expect(std::string(errorKindName(ErrorKind::UnresolvableIdentity)) ==
               "unresolvable-identity");
    };
};
