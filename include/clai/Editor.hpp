/**
 * Editor.hpp - Obtain input text from an interactive editor
 */

#pragma once

#include <string>
#include <vector>

namespace clai {

class Environment;

class TextEditor {
public:
    virtual ~TextEditor() = default;
    
    // Returns the edited text. Throws clai::Error on failure.
    virtual std::string editText(const std::string& initial_content) = 0;
};

// Runs $VISUAL, $EDITOR or vim on a temporary file
class ExternalEditor : public TextEditor {
public:
    static const std::string FALLBACK_EDITOR;
    
    explicit ExternalEditor(const Environment& env);
    
    std::string editText(const std::string& initial_content) override;
    
    // Editor command split into argv words
    std::vector<std::string> editorCommand() const;
    
private:
    const Environment& env_;
};

// Runs the editor and rejects empty or whitespace-only results
std::string promptForInput(TextEditor& editor);

} // namespace clai
