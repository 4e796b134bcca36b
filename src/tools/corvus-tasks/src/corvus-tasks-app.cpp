#define Uses_TApplication
#define Uses_TButton
#define Uses_TDeskTop
#define Uses_TDialog
#define Uses_TEvent
#define Uses_TInputLine
#define Uses_TKeys
#define Uses_TLabel
#define Uses_TListViewer
#define Uses_TMenuBar
#define Uses_TMenuItem
#define Uses_TScrollBar
#define Uses_TStatusDef
#define Uses_TStatusItem
#define Uses_TStatusLine
#define Uses_TSubMenu
#define Uses_TWindow
#define Uses_MsgBox
#include <tvision/tv.h>

#include "corvus/app_info.hpp"
#include "corvus/cli/task_cli.hpp"
#include "corvus/commands/corvus_tasks.hpp"
#include "corvus/log.hpp"
#include "corvus/options.hpp"
#include "corvus/tasks/task_manager.hpp"
#include "corvus/tasks/task_options.hpp"

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <limits.h>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#ifndef CORVUS_TASKS_VERSION
#define CORVUS_TASKS_VERSION "0.1.0"
#endif

namespace config = corvus::config;
namespace tasks = corvus::tasks;
namespace commands = corvus::commands::tasks;

static constexpr std::string_view kToolId = "corvus-tasks";
static constexpr const char *kLogFileName = "corvus-tasks.log";
static constexpr int kFieldLimit = PATH_MAX - 1;

static const corvus::appinfo::ToolInfo &toolInfo()
{
    return corvus::appinfo::requireTool(kToolId);
}

static constexpr unsigned short cmCopyTask = commands::Copy;
static constexpr unsigned short cmMoveTask = commands::Move;
static constexpr unsigned short cmDeleteTask = commands::Delete;
static constexpr unsigned short cmCreateFileTask = commands::CreateFile;
static constexpr unsigned short cmCreateDirectoryTask = commands::CreateDirectory;
static constexpr unsigned short cmChmodTask = commands::Chmod;
static constexpr unsigned short cmChownTask = commands::Chown;
static constexpr unsigned short cmUnmountTask = commands::Unmount;
static constexpr unsigned short cmArchiveTask = commands::Archive;
static constexpr unsigned short cmShowLog = commands::ShowLog;
static constexpr unsigned short cmClearMessage = commands::ClearMessage;
static constexpr unsigned short cmSaveDefaults = commands::SaveDefaults;
static constexpr unsigned short cmAbout = commands::About;

namespace
{

struct FormField
{
    const char *label;
    std::string value;
};

// Modal dialog with one input line per field. Returns false on cancel.
bool runForm(const char *title, std::vector<FormField> &fields)
{
    const int width = 66;
    const int height = static_cast<int>(fields.size()) * 3 + 6;
    const std::size_t stride = static_cast<std::size_t>(kFieldLimit) + 1;

    std::vector<char> record(fields.size() * stride, '\0');
    for (std::size_t i = 0; i < fields.size(); ++i)
        std::snprintf(record.data() + i * stride, stride, "%s", fields[i].value.c_str());

    auto *dialog = new TDialog(TRect(0, 0, width, height), title);
    dialog->options |= ofCentered;
    int y = 2;
    for (const auto &field : fields)
    {
        auto *input = new TInputLine(TRect(3, y + 1, width - 3, y + 2), kFieldLimit);
        dialog->insert(input);
        dialog->insert(new TLabel(TRect(2, y, width - 3, y + 1), field.label, input));
        y += 3;
    }
    dialog->insert(new TButton(TRect(width / 2 - 12, y, width / 2 - 2, y + 2), "O~K~", cmOK, bfDefault));
    dialog->insert(new TButton(TRect(width / 2 + 2, y, width / 2 + 12, y + 2), "Cancel", cmCancel, bfNormal));
    dialog->selectNext(False);

    if (TProgram::application->executeDialog(dialog, record.data()) == cmCancel)
        return false;
    for (std::size_t i = 0; i < fields.size(); ++i)
        fields[i].value = record.data() + i * stride;
    return true;
}

std::vector<std::filesystem::path> splitPaths(const std::string &text)
{
    std::vector<std::filesystem::path> paths;
    std::stringstream stream(text);
    std::string item;
    while (std::getline(stream, item, ';'))
    {
        auto begin = item.find_first_not_of(' ');
        auto end = item.find_last_not_of(' ');
        if (begin != std::string::npos)
            paths.emplace_back(item.substr(begin, end - begin + 1));
    }
    return paths;
}

bool requireValue(const std::string &value, const char *what)
{
    if (!value.empty())
        return true;
    std::string message = std::string(what) + " cannot be empty";
    messageBox(message.c_str(), mfError | mfOKButton);
    return false;
}

} // namespace

class TaskLogWindow;

class TaskListView : public TListViewer
{
public:
    TaskListView(const TRect &bounds, TScrollBar *v, std::vector<tasks::Task> &entries)
        : TListViewer(bounds, 1, nullptr, v), entries(entries)
    {
        setRange(static_cast<short>(entries.size()));
    }

    virtual void getText(char *dest, short item, short maxChars) override
    {
        if (item < 0 || static_cast<std::size_t>(item) >= entries.size())
        {
            *dest = '\0';
            return;
        }
        const auto &task = entries[static_cast<std::size_t>(item)];
        std::string text = "[" + tasks::formatStatus(task.status) + "] " + task.description;
        std::snprintf(dest, maxChars, "%s", text.c_str());
    }

private:
    std::vector<tasks::Task> &entries;
};

class TasksApp;

class TaskLogWindow : public TWindow
{
public:
    TaskLogWindow(TasksApp &app);
    ~TaskLogWindow();

    void update(std::vector<tasks::Task> snapshot);

private:
    TasksApp &app;
    std::vector<tasks::Task> entries;
    TaskListView *listView = nullptr;
};

class TasksStatusLine : public TStatusLine
{
public:
    TasksStatusLine(TRect r)
        : TStatusLine(r, *new TStatusDef(0, 0xFFFF, nullptr))
    {
        showDefaultHints();
    }

    void showDefaultHints()
    {
        currentMessage.clear();
        setItems(buildHintChain());
    }

    void showMessage(std::string message)
    {
        currentMessage = std::move(message);
        auto *item = new TStatusItem(currentMessage.c_str(), kbNoKey, 0);
        item->next = new TStatusItem("Dismiss", kbNoKey, cmClearMessage);
        setItems(item);
    }

private:
    std::string currentMessage;

    void setItems(TStatusItem *chain)
    {
        disposeItems(items);
        items = chain;
        defs->items = items;
        drawView();
    }

    static TStatusItem *buildHintChain()
    {
        return new TStatusItem("~F2~ Copy", kbF2, cmCopyTask,
               new TStatusItem("~F3~ Move", kbF3, cmMoveTask,
               new TStatusItem("~F5~ Mkdir", kbF5, cmCreateDirectoryTask,
               new TStatusItem("~F8~ Delete", kbF8, cmDeleteTask,
               new TStatusItem("~F9~ Archive", kbF9, cmArchiveTask,
               new TStatusItem("~Alt-X~ Exit", kbAltX, cmQuit))))));
    }

    static void disposeItems(TStatusItem *item)
    {
        while (item)
        {
            TStatusItem *next = item->next;
            delete item;
            item = next;
        }
    }
};

class TasksApp : public TApplication
{
public:
    TasksApp(std::shared_ptr<config::OptionRegistry> registry);

    virtual void handleEvent(TEvent &event) override;
    virtual void idle() override;

    static TMenuBar *initMenuBar(TRect r);
    static TStatusLine *initStatusLine(TRect r);

    void logWindowClosed(TaskLogWindow *window);

private:
    std::shared_ptr<config::OptionRegistry> optionRegistry;
    tasks::TaskManager manager;
    TaskLogWindow *logWindow = nullptr;

    void submit(tasks::TaskKind kind);
    void promptTransfer(bool move);
    void promptDelete();
    void promptCreate(bool directory);
    void promptChmod();
    void promptChown();
    void promptUnmount();
    void promptArchive();
    void saveDefaults();

    void showLog();
    void refreshLog();
    void showStatusMessage(const std::string &message);
    void showDefaultStatusHints();
};

TaskLogWindow::TaskLogWindow(TasksApp &appRef)
    : TWindowInit(&TWindow::initFrame),
      TWindow(TRect(0, 0, 78, 18), "Task Log", wnNoNumber),
      app(appRef)
{
    flags |= wfGrow;
    options |= ofCentered;

    TRect client = getExtent();
    client.grow(-1, -1);
    auto *vScroll = new TScrollBar(TRect(client.b.x - 1, client.a.y, client.b.x, client.b.y));
    vScroll->growMode = gfGrowLoX | gfGrowHiX | gfGrowHiY;
    listView = new TaskListView(TRect(client.a.x, client.a.y, client.b.x - 1, client.b.y), vScroll, entries);
    listView->growMode = gfGrowHiX | gfGrowHiY;
    insert(vScroll);
    insert(listView);
}

TaskLogWindow::~TaskLogWindow()
{
    app.logWindowClosed(this);
}

void TaskLogWindow::update(std::vector<tasks::Task> snapshot)
{
    entries = std::move(snapshot);
    listView->setRange(static_cast<short>(entries.size()));
    listView->drawView();
}

TasksApp::TasksApp(std::shared_ptr<config::OptionRegistry> registry)
    : TProgInit(&TasksApp::initStatusLine, &TasksApp::initMenuBar, &TApplication::initDeskTop),
      optionRegistry(std::move(registry)),
      manager(tasks::ExecutorContext{tasks::executorSettingsFromOptions(*optionRegistry), tasks::runCommand})
{
    showLog();
}

void TasksApp::handleEvent(TEvent &event)
{
    TApplication::handleEvent(event);
    if (event.what != evCommand)
        return;

    switch (event.message.command)
    {
    case cmCopyTask:
        promptTransfer(false);
        break;
    case cmMoveTask:
        promptTransfer(true);
        break;
    case cmDeleteTask:
        promptDelete();
        break;
    case cmCreateFileTask:
        promptCreate(false);
        break;
    case cmCreateDirectoryTask:
        promptCreate(true);
        break;
    case cmChmodTask:
        promptChmod();
        break;
    case cmChownTask:
        promptChown();
        break;
    case cmUnmountTask:
        promptUnmount();
        break;
    case cmArchiveTask:
        promptArchive();
        break;
    case cmShowLog:
        showLog();
        break;
    case cmClearMessage:
        showDefaultStatusHints();
        break;
    case cmSaveDefaults:
        saveDefaults();
        break;
    case cmAbout:
    {
        const auto &info = toolInfo();
        std::string text = std::string(info.displayName) + " " + CORVUS_TASKS_VERSION + "\n\n" +
                           std::string(info.aboutDescription);
        messageBox(text.c_str(), mfInformation | mfOKButton);
        break;
    }
    default:
        return;
    }
    clearEvent(event);
}

void TasksApp::idle()
{
    TApplication::idle();

    bool changed = manager.processPendingTasks() > 0;
    while (auto applied = manager.tryApplyNextEvent())
    {
        changed = true;
        if (!applied->applied || !applied->status.isTerminal())
            continue;
        auto task = manager.findTask(applied->taskId);
        if (!task)
            continue;
        if (task->status.state == tasks::TaskState::Completed)
            showStatusMessage("Done: " + task->description);
        else
            showStatusMessage("Failed: " + task->status.failureReason);
    }
    if (changed)
        refreshLog();
}

TMenuBar *TasksApp::initMenuBar(TRect r)
{
    r.b.y = r.a.y + 1;
    TSubMenu &fileMenu = *new TSubMenu("~F~ile", hcNoContext) +
                         *new TMenuItem("~S~ave Defaults", cmSaveDefaults, kbNoKey, hcNoContext) +
                         newLine() +
                         *new TMenuItem("E~x~it", cmQuit, kbAltX, hcExit, "Alt-X");

    TMenuItem &menuChain = fileMenu +
                           *new TSubMenu("~T~asks", hcNoContext) +
                               *new TMenuItem("~C~opy...", cmCopyTask, kbF2, hcNoContext, "F2") +
                               *new TMenuItem("~M~ove...", cmMoveTask, kbF3, hcNoContext, "F3") +
                               *new TMenuItem("~D~elete...", cmDeleteTask, kbF8, hcNoContext, "F8") +
                               newLine() +
                               *new TMenuItem("New ~F~ile...", cmCreateFileTask, kbNoKey, hcNoContext) +
                               *new TMenuItem("New Direc~t~ory...", cmCreateDirectoryTask, kbF5, hcNoContext, "F5") +
                               newLine() +
                               *new TMenuItem("Change ~P~ermissions...", cmChmodTask, kbNoKey, hcNoContext) +
                               *new TMenuItem("Change ~O~wner...", cmChownTask, kbNoKey, hcNoContext) +
                               *new TMenuItem("~U~nmount...", cmUnmountTask, kbNoKey, hcNoContext) +
                               newLine() +
                               *new TMenuItem("~A~rchive...", cmArchiveTask, kbF9, hcNoContext, "F9") +
                           *new TSubMenu("~W~indow", hcNoContext) +
                               *new TMenuItem("Task ~L~og", cmShowLog, kbNoKey, hcNoContext) +
                               *new TMenuItem("~C~lose", cmClose, kbAltF3, hcNoContext, "Alt-F3") +
                           *new TSubMenu("~H~elp", hcNoContext) +
                               *new TMenuItem("~A~bout", cmAbout, kbNoKey, hcNoContext);

    return new TMenuBar(r, static_cast<TSubMenu &>(menuChain));
}

TStatusLine *TasksApp::initStatusLine(TRect r)
{
    r.a.y = r.b.y - 1;
    return new TasksStatusLine(r);
}

void TasksApp::logWindowClosed(TaskLogWindow *window)
{
    if (logWindow == window)
        logWindow = nullptr;
}

void TasksApp::submit(tasks::TaskKind kind)
{
    manager.addTask(std::move(kind));
    refreshLog();
}

void TasksApp::promptTransfer(bool move)
{
    std::string cwd = std::filesystem::current_path().string();
    std::vector<FormField> fields{{"~S~ource:", cwd + "/"}, {"~D~estination:", cwd + "/"}};
    if (!runForm(move ? "Move" : "Copy", fields))
        return;
    if (!requireValue(fields[0].value, "Source") || !requireValue(fields[1].value, "Destination"))
        return;
    if (move)
        submit(tasks::MoveOperation{fields[0].value, fields[1].value});
    else
        submit(tasks::CopyOperation{fields[0].value, fields[1].value});
}

void TasksApp::promptDelete()
{
    std::vector<FormField> fields{{"~P~ath:", std::filesystem::current_path().string() + "/"}};
    if (!runForm("Delete", fields) || !requireValue(fields[0].value, "Path"))
        return;
    std::string question = "Delete '" + fields[0].value + "'?";
    if (messageBox(question.c_str(), mfYesNoCancel | mfConfirmation) != cmYes)
        return;
    submit(tasks::DeleteOperation{fields[0].value});
}

void TasksApp::promptCreate(bool directory)
{
    std::vector<FormField> fields{{"~P~ath:", std::filesystem::current_path().string() + "/"}};
    if (!runForm(directory ? "New Directory" : "New File", fields) || !requireValue(fields[0].value, "Path"))
        return;
    if (directory)
        submit(tasks::CreateDirectoryOperation{fields[0].value});
    else
        submit(tasks::CreateFileOperation{fields[0].value});
}

void TasksApp::promptChmod()
{
    std::vector<FormField> fields{{"~P~ath:", std::filesystem::current_path().string() + "/"},
                                  {"~M~ode (octal):", "644"}};
    if (!runForm("Change Permissions", fields) || !requireValue(fields[0].value, "Path"))
        return;
    auto mode = tasks::parseOctalMode(fields[1].value);
    if (!mode)
    {
        messageBox("Mode must be an octal number such as 755", mfError | mfOKButton);
        return;
    }
    submit(tasks::ChmodOperation{fields[0].value, *mode});
}

void TasksApp::promptChown()
{
    std::vector<FormField> fields{{"~P~ath:", std::filesystem::current_path().string() + "/"},
                                  {"~O~wner (user or user:group):", ""}};
    if (!runForm("Change Owner", fields))
        return;
    if (!requireValue(fields[0].value, "Path") || !requireValue(fields[1].value, "Owner"))
        return;
    submit(tasks::ChownOperation{fields[0].value, fields[1].value});
}

void TasksApp::promptUnmount()
{
    std::vector<FormField> fields{{"~M~ount point:", ""}};
    if (!runForm("Unmount", fields) || !requireValue(fields[0].value, "Mount point"))
        return;
    submit(tasks::UnmountOperation{fields[0].value});
}

void TasksApp::promptArchive()
{
    std::string cwd = std::filesystem::current_path().string();
    std::vector<FormField> fields{{"~I~tems (separated by ;):", ""},
                                  {"~D~irectory:", cwd},
                                  {"~N~ame:", "archive"},
                                  {"~F~ormat (zip, tar, tar.gz):", tasks::defaultArchiveFormat(*optionRegistry)}};
    if (!runForm("Archive", fields))
        return;
    std::vector<std::filesystem::path> items = splitPaths(fields[0].value);
    if (items.empty())
    {
        messageBox("Select at least one item to archive", mfError | mfOKButton);
        return;
    }
    if (!requireValue(fields[2].value, "Name"))
        return;

    tasks::ArchiveOperation operation;
    operation.paths = std::move(items);
    operation.format = fields[3].value;
    operation.destination = tasks::archiveDestination(fields[1].value, fields[2].value, operation.format);
    submit(std::move(operation));
}

void TasksApp::saveDefaults()
{
    std::string error;
    if (!optionRegistry->saveDefaults(&error))
    {
        std::string message = "Failed to save defaults: " + error;
        messageBox(message.c_str(), mfError | mfOKButton);
        return;
    }
    showStatusMessage("Defaults saved to " + optionRegistry->defaultOptionsPath().string());
}

void TasksApp::showLog()
{
    if (logWindow)
    {
        logWindow->select();
        return;
    }
    logWindow = new TaskLogWindow(*this);
    deskTop->insert(logWindow);
    refreshLog();
}

void TasksApp::refreshLog()
{
    if (logWindow)
        logWindow->update(manager.getTasks());
}

void TasksApp::showStatusMessage(const std::string &message)
{
    if (auto *line = dynamic_cast<TasksStatusLine *>(statusLine))
        line->showMessage(message);
}

void TasksApp::showDefaultStatusHints()
{
    if (auto *line = dynamic_cast<TasksStatusLine *>(statusLine))
        line->showDefaultHints();
}

static bool configureLogging(const config::OptionRegistry &registry, const corvus::cli::TaskArguments &arguments,
                             bool interactive)
{
    if (!std::getenv("CORVUS_LOG_LEVEL"))
    {
        std::string configured = registry.getString(tasks::kOptionLogLevel, "info");
        if (auto level = corvus::log::parseLevel(configured))
            corvus::log::setLevel(*level);
        else
            std::cerr << "corvus-tasks: ignoring unknown log level '" << configured << "'" << std::endl;
    }

    std::filesystem::path logFile;
    if (arguments.logFile)
        logFile = *arguments.logFile;
    else if (std::string configured = registry.getString(tasks::kOptionLogFile); !configured.empty())
        logFile = configured;
    else if (interactive)
        logFile = config::OptionRegistry::configRoot() / kLogFileName;

    // The terminal belongs to Turbo Vision in interactive mode; never log to stderr there.
    if (logFile.empty())
        return true;
    std::string error;
    if (!corvus::log::setLogFile(logFile, &error))
    {
        std::cerr << "corvus-tasks: " << error << std::endl;
        if (!interactive)
            return false;
        corvus::log::setHandler([](corvus::log::Level, std::string_view) {});
    }
    return true;
}

int main(int argc, char **argv)
{
    corvus::cli::TaskArguments arguments;
    std::string error;
    if (!corvus::cli::parseTaskArguments(argc, argv, arguments, &error))
    {
        std::cerr << "corvus-tasks: " << error << "\n"
                  << "Try 'corvus-tasks --help'." << std::endl;
        return 1;
    }
    if (arguments.showHelp)
    {
        corvus::cli::printUsage(std::cout);
        return 0;
    }

    auto registry = std::make_shared<config::OptionRegistry>(std::string(kToolId));
    tasks::registerTaskOptions(*registry);
    if (arguments.loadDefaults)
    {
        std::string loadError;
        if (!registry->loadDefaults(&loadError) && !loadError.empty())
            std::cerr << "corvus-tasks: " << loadError << std::endl;
    }
    for (const auto &file : arguments.configFiles)
    {
        std::string loadError;
        if (!registry->loadFromFile(file, &loadError))
        {
            std::cerr << "corvus-tasks: " << loadError << std::endl;
            return 1;
        }
    }

    const bool interactive = !arguments.operation.has_value();
    if (!configureLogging(*registry, arguments, interactive))
        return 1;
    corvus::log::setThreadName("main");

    if (!interactive)
    {
        tasks::ExecutorContext context{tasks::executorSettingsFromOptions(*registry), tasks::runCommand};
        return corvus::cli::runSingleTask(*arguments.operation, context, std::cout, std::cerr);
    }

    CORVUS_LOG_INFO("corvus-tasks " CORVUS_TASKS_VERSION " started");
    TasksApp app(registry);
    app.run();
    CORVUS_LOG_INFO("corvus-tasks exiting");
    return 0;
}
