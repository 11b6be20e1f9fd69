/**
 * Editor.cpp - Obtain input text from an interactive editor
 *
 * The editor runs on a mkstemp() file via fork/execvp, so no shell is involved.
 * The file is removed on every exit path.
 */

#include "clai/Editor.hpp"
#include "clai/Environment.hpp"
#include "clai/Error.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <sstream>

#include <sys/wait.h>
#include <unistd.h>

namespace clai {

const std::string ExternalEditor::FALLBACK_EDITOR = "vim";

namespace {

class TempFile {
public:
    TempFile() {
        std::string pattern = (std::filesystem::temp_directory_path() / "clai_XXXXXX").string();
        int fd = ::mkstemp(&pattern[0]);
        if (fd == -1) {
            throw Error(ErrorKind::IO, std::string("Could not create temporary file: ") + std::strerror(errno));
        }
        ::close(fd);
        path_ = pattern;
    }
    
    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    
    const std::string& path() const { return path_; }
    
private:
    std::string path_;
};

int runEditor(const std::vector<std::string>& command, const std::string& file) {
    std::vector<std::string> args = command;
    args.push_back(file);
    
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (auto& arg : args) {
        argv.push_back(&arg[0]);
    }
    argv.push_back(nullptr);
    
    pid_t pid = ::fork();
    if (pid == -1) {
        throw Error(ErrorKind::EXTERNAL_PROCESS, std::string("fork failed: ") + std::strerror(errno));
    }
    
    if (pid == 0) {
        ::execvp(argv[0], argv.data());
        _exit(127);
    }
    
    int status = 0;
    while (::waitpid(pid, &status, 0) == -1) {
        if (errno != EINTR) {
            throw Error(ErrorKind::EXTERNAL_PROCESS, std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    return -1;
}

} // anonymous namespace

ExternalEditor::ExternalEditor(const Environment& env) : env_(env) {}

std::vector<std::string> ExternalEditor::editorCommand() const {
    std::string editor = FALLBACK_EDITOR;
    for (const char* name : {"VISUAL", "EDITOR"}) {
        auto value = env_.get(name);
        if (value && value->find_first_not_of(" \t") != std::string::npos) {
            editor = *value;
            break;
        }
    }
    
    // "code --wait" -> {"code", "--wait"}
    std::vector<std::string> words;
    std::istringstream iss(editor);
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::string ExternalEditor::editText(const std::string& initial_content) {
    TempFile temp;
    
    if (!initial_content.empty()) {
        std::ofstream out(temp.path(), std::ios::binary);
        out << initial_content;
        if (!out) {
            throw Error(ErrorKind::IO, "Could not write temporary file " + temp.path());
        }
    }
    
    auto command = editorCommand();
    int exit_code = runEditor(command, temp.path());
    if (exit_code != 0) {
        throw Error(ErrorKind::EXTERNAL_PROCESS,
                    command[0] + " exited with an error (status " + std::to_string(exit_code) + ")");
    }
    
    std::ifstream in(temp.path(), std::ios::binary);
    if (!in) {
        throw Error(ErrorKind::IO, "Could not read temporary file " + temp.path());
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

std::string promptForInput(TextEditor& editor) {
    std::string content = editor.editText("");
    if (content.find_first_not_of(" \t\n\r\f\v") == std::string::npos) {
        throw Error(ErrorKind::EXTERNAL_PROCESS, "No content was written in the file.");
    }
    return content;
}

} // namespace clai
