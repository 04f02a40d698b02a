#include "repository/MasterFileParser.h"
#include "utils/DateUtils.h"
#include <QDebug>
#include <QStringList>

bool MasterFileParser::parseOptionLine(const QString &line,
                                       ContractData &contract) {
  QStringList fields = line.trimmed().split('|');

  if (fields.size() < 19) {
    return false;
  }

  bool ok;
  contract.exchangeInstrumentID = fields[1].toLongLong(&ok);
  if (!ok)
    return false;

  OptionType type;
  if (!convertOptionType(fields[18].toInt(), type)) {
    return false; // futures / XX
  }

  contract.exchange = "NSEFO";
  contract.name = fields[3].trimmed();
  contract.tradingSymbol = fields[4].trimmed();
  contract.tickSize = fields[11].toDouble();
  contract.lotSize = fields[12].toInt(&ok);
  if (!ok || contract.lotSize <= 0)
    return false;

  contract.strikePrice = fields[17].toDouble(&ok);
  if (!ok || contract.strikePrice <= 0)
    return false;
  contract.optionType = type;

  if (!DateUtils::parseExpiryDate(fields[16].trimmed(), contract.expiryDate,
                                  contract.expiry)) {
    return false;
  }

  // Some dumps leave the description empty; fall back to the display name
  if (contract.tradingSymbol.isEmpty() && fields.size() >= 20) {
    contract.tradingSymbol = fields[19].trimmed();
  }

  return !contract.tradingSymbol.isEmpty();
}

QVector<ContractData> MasterFileParser::parseContent(const QString &content,
                                                     int *skipped) {
  QVector<ContractData> contracts;
  int skippedLines = 0;

  const QStringList lines = content.split('\n', Qt::SkipEmptyParts);
  contracts.reserve(lines.size());

  for (const QString &line : lines) {
    ContractData contract;
    if (parseOptionLine(line, contract)) {
      contracts.append(contract);
    } else {
      skippedLines++;
    }
  }

  if (skipped)
    *skipped = skippedLines;

  qDebug() << "[MasterFileParser] Parsed" << contracts.size()
           << "option contracts," << skippedLines << "lines skipped";
  return contracts;
}

bool MasterFileParser::convertOptionType(int32_t code, OptionType &type) {
  switch (code) {
  case 1:
  case 3:
    type = OptionType::Call;
    return true;
  case 2:
  case 4:
    type = OptionType::Put;
    return true;
  default:
    return false;
  }
}
