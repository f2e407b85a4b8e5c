#include "transferbackend.h"

QString transferActionName(TransferAction action) {
    switch (action) {
    case TransferAction::Cancel: return "cancel";
    case TransferAction::Pause:  return "pause";
    case TransferAction::Resume: return "resume";
    }
    return "cancel";
}

QString transferActionTitle(TransferAction action) {
    QString name = transferActionName(action);
    name[0] = name.at(0).toUpper();
    return name;
}
