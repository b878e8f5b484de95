#include "clipboard/clipboard_delivery.hpp"

QString AppleScriptClipboardDelivery::quoteString(const QString& text) {
    QString out;
    out.reserve(text.size() + 2);
    out.append(QLatin1Char('"'));
    for (const QChar c : text) {
        if (c == QLatin1Char('\\') || c == QLatin1Char('"'))
            out.append(QLatin1Char('\\'));
        out.append(c);
    }
    out.append(QLatin1Char('"'));
    return out;
}

HelperCommand AppleScriptClipboardDelivery::commandFor(const QString& path) const {
    return HelperCommand{
        QStringLiteral("/usr/bin/osascript"),
        {QStringLiteral("-e"),
         QStringLiteral("set the clipboard to (POSIX file %1)").arg(quoteString(path))}
    };
}
