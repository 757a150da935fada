#include "Koma.hpp"

#include <QApplication>
#include <QDebug>
#include <argparse/argparse.hpp>

void
init_args(argparse::ArgumentParser &program)
{
    program.add_argument("-p", "--page")
        .help("Page number to open the document at")
        .scan<'i', int>()
        .default_value(-1)
        .metavar("PAGE_NUMBER");

    program.add_argument("-c", "--config")
        .help("Path to config.toml file")
        .nargs(1)
        .metavar("CONFIG_PATH");

    program.add_argument("--panels")
        .help("Panel data file to use instead of the one next to the document")
        .nargs(1)
        .metavar("PANELS_JSON");

    program.add_argument("--panel-zoom")
        .help("Start with panel zoom integration enabled")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("files").remaining().metavar("FILE_PATH");
}

int
main(int argc, char *argv[])
{
    argparse::ArgumentParser program("koma", APP_VERSION,
                                     argparse::default_arguments::all);
    init_args(program);
    try
    {
        program.parse_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        qCritical() << e.what();
        return 1;
    }

    QGuiApplication::setHighDpiScaleFactorRoundingPolicy(
        Qt::HighDpiScaleFactorRoundingPolicy::PassThrough);
    QApplication app(argc, argv);
    app.setApplicationName("koma");
    app.setApplicationVersion(APP_VERSION);

    Koma k;
    k.Read_args_parser(program);
    return app.exec();
}
