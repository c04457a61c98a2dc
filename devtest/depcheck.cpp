// =====================================================================
//  devtest/depcheck.cpp — liblocus Dependency Verification
// =====================================================================
//
//  Compiles and links against every liblocus dependency, then
//  exercises each one at runtime to verify the installation.
//
//  Cross-platform: Linux, Windows (MSVC/MinGW), macOS (Apple Clang).
//
//  Required:
//    Qt Core (logging categories), Qt Gui (vector and quaternion math)
//
//  Library smoke test:
//    liblocus regions built and queried through the Locus3f interface
//
//  Exit code:
//    0 = all checks passed
//    1 = one or more checks FAILED
//
// =====================================================================

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <memory>
#include <ctime>
#include <cmath>

// ---- Qt -----------------------------------------------------------

#include <QtCore/qconfig.h>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <QQuaternion>
#include <QVector3D>

// ---- liblocus -----------------------------------------------------

#include <locus/core.h>
#include <locus/polygon/simplepolygon.h>
#include <locus/region/segment.h>
#include <locus/region/shell.h>

// ---- Test framework -------------------------------------------------

enum Status { PASS, WARN, FAIL };

struct DepResult {
    std::string section;
    std::string name;
    std::string version;
    Status      status;
    std::string detail;
    std::string fix;        // corrective action for WARN/FAIL
};

// Platform name for install hints in runtime output
static const char* platform_name()
{
#if defined(__APPLE__)
    return "macos";
#elif defined(_WIN32)
    return "windows";
#else
    return "linux";
#endif
}

static std::string qt_install_hint()
{
    std::string plat = platform_name();
    if (plat == "linux")
        return "sudo apt-get install -y qt6-base-dev";
    if (plat == "macos")
        return "brew install qt@6";
    return "install Qt 6 from https://www.qt.io/download";
}

static bool near(float a, float b, float tolerance = 1e-4f)
{
    return std::fabs(a - b) <= tolerance;
}

// =====================================================================
//  Tests
// =====================================================================

int main(int argc, char* argv[])
{
    std::vector<DepResult> results;
    int pass = 0, warn = 0, fail = 0;

    auto add = [&](DepResult r) {
        results.push_back(r);
        if      (r.status == PASS) pass++;
        else if (r.status == WARN) warn++;
        else                       fail++;
    };

    // =================================================================
    //  Dependencies
    // =================================================================

    // Qt Core — application object and categorized logging
    std::unique_ptr<QCoreApplication> qapp;
    {
        DepResult r{"deps", "Qt Core", QT_VERSION_STR, FAIL, "", ""};
        qapp = std::make_unique<QCoreApplication>(argc, argv);
        QLoggingCategory category("locus.depcheck");
        if (category.isWarningEnabled()) {
            r.status = PASS;
            r.detail = "QCoreApplication + QLoggingCategory OK";
        } else {
            r.status = WARN;
            r.detail = "warnings disabled by logging rules";
            r.fix    = "check QT_LOGGING_RULES";
        }
        add(r);
    }

    // Qt Gui — QVector3D / QQuaternion math
    {
        DepResult r{"deps", "Qt Gui", QT_VERSION_STR, FAIL, "", ""};
        QQuaternion quarter = QQuaternion::fromAxisAndAngle(0, 1, 0, 90.0f);
        QVector3D rotated = quarter.rotatedVector(QVector3D(1, 0, 0));
        if (near(rotated.x(), 0.0f) && near(rotated.z(), -1.0f)) {
            r.status = PASS;
            r.detail = "quaternion rotation OK";
        } else {
            r.detail = "unexpected quaternion rotation result";
            r.fix    = qt_install_hint();
        }
        add(r);
    }

    // =================================================================
    //  liblocus
    // =================================================================

    {
        DepResult r{"locus", "initialize", locus::version(), FAIL, "", ""};
        if (locus::initialize()) {
            r.status = PASS;
            r.detail = "logging rules installed";
        } else {
            r.detail = "locus::initialize() returned false";
        }
        add(r);
    }

    // Spherical shell: containment and projection onto both surfaces
    {
        DepResult r{"locus", "Shell3f", "", FAIL, "", ""};
        locus::region::ShellResult made =
            locus::region::Shell3f::hollow(QVector3D(0, 0, 0), 2.0f, 5.0f);
        if (!made.success) {
            r.detail = made.errorMessage.toStdString();
        } else {
            const locus::region::Locus3f& shell = *made.shell;
            QVector3D outer = shell.findLocation(QVector3D(10, 0, 0));
            QVector3D inner = shell.findLocation(QVector3D(1, 0, 0));
            if (shell.contains(QVector3D(3, 0, 0)) && near(outer.x(), 5.0f)
                && near(inner.x(), 2.0f)) {
                r.status = PASS;
                r.detail = shell.describe().toStdString();
            } else {
                r.detail = "unexpected containment or projection";
            }
        }
        add(r);
    }

    // Unit square: area, centroid and a merge with its neighbor
    {
        DepResult r{"locus", "SimplePolygon3f", "", FAIL, "", ""};
        using locus::polygon::SimplePolygon3f;
        auto left = SimplePolygon3f::create(
            {QVector3D(0, 0, 0), QVector3D(1, 0, 0), QVector3D(1, 0, 1),
             QVector3D(0, 0, 1)}, 0.01f);
        auto right = SimplePolygon3f::create(
            {QVector3D(1, 0, 0), QVector3D(2, 0, 0), QVector3D(2, 0, 1),
             QVector3D(1, 0, 1)}, 0.01f);
        if (!left.success || !right.success) {
            r.detail = "construction failed";
        } else {
            locus::region::MergeResult merged = left.polygon->merge(*right.polygon);
            if (near(left.polygon->area(), 1.0f) && merged.success) {
                r.status = PASS;
                r.detail = merged.locus->describe().toStdString();
            } else {
                r.detail = "unexpected area or failed merge";
            }
        }
        add(r);
    }

    // Segment: nearest point
    {
        DepResult r{"locus", "Segment3f", "", FAIL, "", ""};
        locus::region::Segment3f rail(QVector3D(0, 0, 0), QVector3D(10, 0, 0), 0.01f);
        QVector3D nearest = rail.findLocation(QVector3D(5, 3, 0));
        if (near(nearest.x(), 5.0f) && near(nearest.y(), 0.0f)) {
            r.status = PASS;
            r.detail = "nearest point OK";
        } else {
            r.detail = "unexpected nearest point";
        }
        add(r);
    }

    locus::shutdown();

    // =================================================================
    //  Report
    // =================================================================

    auto write_report = [&](std::ostream& out, bool verbose) {
        if (verbose) {
            std::time_t now = std::time(nullptr);
            char timebuf[64];
            std::strftime(timebuf, sizeof(timebuf),
                          "%Y-%m-%d %H:%M:%S %Z", std::localtime(&now));
            out << "Timestamp: " << timebuf << "\n";

#if defined(__clang__)
            out << "Compiler:  Clang " << __clang_version__ << "\n";
#elif defined(__GNUC__)
            out << "Compiler:  GCC " << __GNUC__ << "."
                << __GNUC_MINOR__ << "." << __GNUC_PATCHLEVEL__ << "\n";
#elif defined(_MSC_VER)
            out << "Compiler:  MSVC " << _MSC_FULL_VER << "\n";
#else
            out << "Compiler:  unknown\n";
#endif
            out << "C++ std:   " << __cplusplus << "\n";

#ifdef NDEBUG
            out << "Build:     Release\n";
#else
            out << "Build:     Debug\n";
#endif
            out << "\n";
        }

        out << "===== liblocus Dependency Check =====\n"
            << "Platform: " << platform_name() << "\n";

        std::string current_section;
        for (const auto& r : results) {
            if (r.section != current_section) {
                current_section = r.section;
                out << "\n  -- " << (current_section == "deps" ? "Dependencies"
                                                               : "liblocus")
                    << " --\n";
            }

            const char* tag = (r.status == PASS) ? "PASS" :
                              (r.status == WARN) ? "WARN" : "FAIL";
            out << "  [" << tag << "] " << r.name;
            if (!r.version.empty())
                out << " " << r.version;
            if (!r.detail.empty())
                out << " - " << r.detail;
            out << "\n";
            if (!r.fix.empty())
                out << "         -> " << r.fix << "\n";
        }

        out << "\n===== Results: "
            << pass << " passed, "
            << warn << " warnings, "
            << fail << " failed"
            << " out of " << (pass + warn + fail)
            << " =====\n";

        // Machine-readable final line for build scripts.
        if (fail > 0) {
            out << "\nDEVTEST_RESULT: [FAIL] liblocus checks failed\n";
        } else {
            out << "\nDEVTEST_RESULT: [PASS] Success!\n";
        }
    };

    write_report(std::cout, false);

    const char* log_path =
#ifdef DEPCHECK_LOG_PATH
        DEPCHECK_LOG_PATH;
#else
        "devtest.log";
#endif

    std::ofstream logfile(log_path, std::ios::app);
    if (logfile.is_open()) {
        logfile << "--- Runtime Results ---\n\n";
        write_report(logfile, true);
        logfile.close();
        std::cout << "\nLog written to " << log_path << "\n";
    } else {
        std::cerr << "\nWarning: could not write " << log_path << "\n";
    }

    return fail > 0 ? 1 : 0;
}
