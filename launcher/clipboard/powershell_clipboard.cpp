#include "clipboard/clipboard_delivery.hpp"

#include <QByteArray>

QString PowerShellClipboardDelivery::quoteLiteral(const QString& text) {
    QString out;
    out.reserve(text.size() + 2);
    out.append(QLatin1Char('\''));
    for (const QChar c : text) {
        const ushort u = c.unicode();
        // PowerShell 把 ' 以及 U+2018 U+2019 U+201A U+201B 都当作单引号
        if (u == '\'' || (u >= 0x2018 && u <= 0x201B))
            out.append(c);
        out.append(c);
    }
    out.append(QLatin1Char('\''));
    return out;
}

QString PowerShellClipboardDelivery::scriptFor(const QString& path) {
    return QStringLiteral("$ErrorActionPreference = 'Stop'; Set-Clipboard -LiteralPath ")
           + quoteLiteral(path);
}

QString PowerShellClipboardDelivery::encodeCommand(const QString& script) {
    QByteArray utf16le;
    utf16le.reserve(script.size() * 2);
    for (const QChar c : script) {
        const ushort u = c.unicode();
        utf16le.append(static_cast<char>(u & 0xFF));
        utf16le.append(static_cast<char>((u >> 8) & 0xFF));
    }
    return QString::fromLatin1(utf16le.toBase64());
}

HelperCommand PowerShellClipboardDelivery::commandFor(const QString& path) const {
    return HelperCommand{
        QStringLiteral("powershell.exe"),
        {QStringLiteral("-NoProfile"), QStringLiteral("-NonInteractive"),
         QStringLiteral("-EncodedCommand"), encodeCommand(scriptFor(path))}
    };
}
