// =====================================================================
//  src/tangram/main.cpp — Tangram startup
// =====================================================================
//
//  Parses the command line, loads preferences, lays the seven pieces
//  out on the field and runs the window.  With --print the final
//  vertices of every piece are written to stdout after the window
//  closes.
//
//  SPDX-License-Identifier: GPL-3.0-only
//
// =====================================================================

#include <tangram/core.h>
#include <tangram/geometry/types.h>
#include <tangram/shapes/puzzle.h>

#include "app/logging.h"
#include "app/settings.h"
#include "gui/tangramwindow.h"

#include <QApplication>
#include <QLoggingCategory>
#include <QSettings>
#include <QSizeF>

#include <cstdio>
#include <iostream>

Q_LOGGING_CATEGORY(lcMain, "tangram.main")

// ---- Helper: command-line flags -------------------------------------

struct StartupFlags {
    bool help    = false;
    bool draft   = false;
    bool print   = false;
    bool noSnap  = false;
    bool debug   = false;
    QString unknown;       // first unrecognized argument, if any
};

static StartupFlags parseFlags(int argc, char* argv[])
{
    StartupFlags flags;

    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        if (arg == QLatin1String("-h") || arg == QLatin1String("--help")) {
            flags.help = true;
        }
        else if (arg == QLatin1String("-d") || arg == QLatin1String("--draft")) {
            flags.draft = true;
        }
        else if (arg == QLatin1String("-p") || arg == QLatin1String("--print")) {
            flags.print = true;
        }
        else if (arg == QLatin1String("--no-snap")) {
            flags.noSnap = true;
        }
        else if (arg == QLatin1String("--debug")) {
            flags.debug = true;
        }
        else if (flags.unknown.isEmpty()) {
            flags.unknown = arg;
        }
    }

    return flags;
}

static void printUsage(std::ostream& out)
{
    out << "Tangram puzzle: dock the seven pieces together to form a figure.\n"
           "\n"
           "Press the mouse button near a piece's centre to move it, or\n"
           "inside the piece away from the centre to rotate it.  Edges\n"
           "that come close snap together when the button is released.\n"
           "\n"
           "Usage: tangram [options]\n"
           "\n"
           "  -h, --help     print this help message and exit\n"
           "  -d, --draft    draw pieces in draft mode\n"
           "  -p, --print    print piece vertices after the window closes\n"
           "      --no-snap  highlight docking edges without snapping\n"
           "      --debug    enable debug logging\n";
}

static void printLayout(const QVector<tangram::shapes::Shape>& shapes)
{
    for (int i = 0; i < shapes.size(); ++i) {
        std::printf("Shape %d vertices:\n", i);
        for (const QPointF& v : shapes[i].vertices()) {
            std::printf("\t (%.2f, %.2f)\n", v.x(), v.y());
        }
    }
    std::fflush(stdout);
}

// ---- main ------------------------------------------------------------

int main(int argc, char* argv[])
{
    StartupFlags flags = parseFlags(argc, argv);

    if (flags.help) {
        printUsage(std::cout);
        return 0;
    }
    if (!flags.unknown.isEmpty()) {
        std::cerr << "Unknown option: " << flags.unknown.toStdString()
                  << "\n\n";
        printUsage(std::cerr);
        return 2;
    }

    tangram::Logging::initialize(flags.debug);

    if (!tangram::initialize()) {
        qCCritical(lcMain) << "failed to initialize libtangram";
        return 1;
    }

    QApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("Tangram"));
    app.setApplicationVersion(QString::fromLatin1(tangram::version()));
    app.setOrganizationName(QStringLiteral("Tangram"));

    // Stored preferences, then this run's flags on top
    QSettings store;
    tangram::AppSettings settings = tangram::loadSettings(store);
    if (flags.draft) {
        settings.draftMode = true;
    }
    if (flags.print) {
        settings.printLayout = true;
    }
    if (flags.noSnap) {
        settings.snapOnRelease = false;
    }

    QVector<tangram::shapes::Shape> pieces;
    try {
        pieces = tangram::shapes::standardPuzzle();
    } catch (const tangram::geometry::DegenerateGeometry& e) {
        qCCritical(lcMain) << "cannot build the piece set:" << e.what();
        tangram::shutdown();
        tangram::Logging::shutdown();
        return 1;
    }
    tangram::shapes::arrangeInGrid(pieces, QSizeF(settings.fieldSize));

    qCInfo(lcMain) << "starting with" << pieces.size() << "pieces,"
                   << (settings.draftMode ? "draft" : "filled") << "mode";

    tangram::TangramWindow window(pieces, settings);
    window.show();

    int result = app.exec();

    if (settings.printLayout) {
        printLayout(window.shapes());
    }

    tangram::shutdown();
    tangram::Logging::shutdown();
    return result;
}
