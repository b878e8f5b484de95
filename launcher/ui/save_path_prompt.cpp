#include "ui/save_path_prompt.hpp"

#include <QDir>
#include <QFileDialog>
#include <QStandardPaths>

QString DialogSavePathPrompt::askSavePath(const QString& suggestedName)
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (dir.isEmpty()) dir = QDir::homePath();

    return QFileDialog::getSaveFileName(parent_, QStringLiteral("Save asset"),
                                        QDir(dir).filePath(suggestedName),
                                        QStringLiteral("All Files (*)"));
}
